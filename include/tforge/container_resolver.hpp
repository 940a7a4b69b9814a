#pragma once

#include <QString>

#include <memory>

#include "tforge/app_config.hpp"

namespace tforge {

// Locates the per-application data container that project storage prefers.
class ContainerResolver {
public:
    virtual ~ContainerResolver() = default;

    // Empty when no container is available.
    virtual QString containerPath() const = 0;
    virtual QString name() const = 0;
};

class StandardContainerResolver final : public ContainerResolver {
public:
    QString containerPath() const override;
    QString name() const override { return "standard"; }
};

class NullContainerResolver final : public ContainerResolver {
public:
    QString containerPath() const override { return {}; }
    QString name() const override { return "none"; }
};

// Picks the implementation named by store.container_resolver; unknown names
// fall back to the standard resolver.
std::unique_ptr<ContainerResolver> makeContainerResolver(const AppConfig& config);

}  // namespace tforge

#include "tforge/container_resolver.hpp"

#include <QStandardPaths>

namespace tforge {

QString StandardContainerResolver::containerPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

std::unique_ptr<ContainerResolver> makeContainerResolver(const AppConfig& config) {
    const QString kind = config.store.containerResolver.trimmed().toLower();
    if (kind == "none" || kind == "null") {
        return std::make_unique<NullContainerResolver>();
    }
    return std::make_unique<StandardContainerResolver>();
}

}  // namespace tforge

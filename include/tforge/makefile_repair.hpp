#pragma once

#include <QJsonObject>
#include <QString>

namespace tforge {

// Rewrites build descriptors copied from a developer machine so that the
// toolchain root comes from the THEOS environment variable.
class MakefileRepair {
public:
    struct Patch {
        QString content;
        int commentedLines = 0;
        int rewrittenLines = 0;

        [[nodiscard]] bool changed() const { return commentedLines > 0 || rewrittenLines > 0; }
    };

    // True when the text mentions a /Users/<name>/theos style location.
    static bool hasForeignToolchainPaths(const QString& content);
    static Patch rewrite(const QString& content);

    // Result keys: success, changed, commented_lines, rewritten_lines, path, error.
    static QJsonObject repairFile(const QString& makefilePath);
};

}  // namespace tforge

#include "tforge/makefile_repair.hpp"

#include <QFile>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStringList>

#include "tforge/telemetry.hpp"

namespace tforge {

namespace {

const QRegularExpression& theosDefinition() {
    static const QRegularExpression pattern(R"(^\s*(export\s+)?THEOS\s*[:?+]?=)");
    return pattern;
}

const QRegularExpression& foreignTheosPath() {
    static const QRegularExpression pattern(R"(/Users/[^/\s]+/theos)");
    return pattern;
}

bool isComment(const QString& line) {
    return line.trimmed().startsWith('#');
}

}  // namespace

bool MakefileRepair::hasForeignToolchainPaths(const QString& content) {
    return content.contains("/Users/") && content.contains("/theos");
}

MakefileRepair::Patch MakefileRepair::rewrite(const QString& content) {
    Patch patch;
    if (!hasForeignToolchainPaths(content)) {
        patch.content = content;
        return patch;
    }

    QStringList lines = content.split('\n');
    for (QString& line : lines) {
        if (isComment(line)) {
            continue;
        }
        if (theosDefinition().match(line).hasMatch()) {
            line = QString("# %1 # Auto-commented: THEOS set via environment").arg(line);
            patch.commentedLines++;
        } else if (line.contains(foreignTheosPath())) {
            line.replace(foreignTheosPath(), "$(THEOS)");
            patch.rewrittenLines++;
        }
    }
    patch.content = lines.join('\n');
    return patch;
}

QJsonObject MakefileRepair::repairFile(const QString& makefilePath) {
    QFile input(makefilePath);
    if (!input.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"changed", false},
            {"error", "Failed to read Makefile."},
            {"path", makefilePath},
        };
    }
    const QString original = QString::fromUtf8(input.readAll());
    input.close();

    const Patch patch = rewrite(original);
    if (!patch.changed()) {
        return {
            {"success", true},
            {"changed", false},
            {"path", makefilePath},
        };
    }

    QSaveFile output(makefilePath);
    if (!output.open(QIODevice::WriteOnly)) {
        return {
            {"success", false},
            {"changed", false},
            {"error", QString("Failed to open Makefile for writing: %1").arg(output.errorString())},
            {"path", makefilePath},
        };
    }
    output.write(patch.content.toUtf8());
    if (!output.commit()) {
        return {
            {"success", false},
            {"changed", false},
            {"error", QString("Failed to write Makefile: %1").arg(output.errorString())},
            {"path", makefilePath},
        };
    }

    Telemetry::instance().incrementCounter("makefile.repaired");
    return {
        {"success", true},
        {"changed", true},
        {"commented_lines", patch.commentedLines},
        {"rewritten_lines", patch.rewrittenLines},
        {"path", makefilePath},
    };
}

}  // namespace tforge

#include "EngineConfig.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(logEngineConfig, "geodeduce.core.config")

namespace geodeduce::core {

namespace {

template <typename Parse>
void overrideFromEnvironment(const char* name, Parse parse) {
    const QString raw = qEnvironmentVariable(name).trimmed();
    if (raw.isEmpty()) {
        return;
    }
    if (!parse(raw)) {
        qCWarning(logEngineConfig) << "Ignoring malformed" << name << "value" << raw;
    }
}

} // namespace

EngineConfig EngineConfig::fromEnvironment() {
    EngineConfig config;

    overrideFromEnvironment("GEODEDUCE_SOLVER_TOLERANCE", [&config](const QString& raw) {
        bool ok = false;
        const double value = raw.toDouble(&ok);
        if (!ok || !(value > 0.0)) {
            return false;
        }
        config.solver.tolerance = value;
        return true;
    });

    overrideFromEnvironment("GEODEDUCE_SOLVER_MAX_BRANCHES", [&config](const QString& raw) {
        bool ok = false;
        const qulonglong value = raw.toULongLong(&ok);
        if (!ok || value == 0) {
            return false;
        }
        config.solver.maxBranches = static_cast<std::size_t>(value);
        return true;
    });

    overrideFromEnvironment("GEODEDUCE_MAX_CASCADE_STEPS", [&config](const QString& raw) {
        bool ok = false;
        const qulonglong value = raw.toULongLong(&ok);
        if (!ok || value == 0) {
            return false;
        }
        config.maxCascadeSteps = static_cast<std::size_t>(value);
        return true;
    });

    overrideFromEnvironment("GEODEDUCE_AUTO_SOLVE", [&config](const QString& raw) {
        const QString normalized = raw.toLower();
        if (normalized == "1" || normalized == "true" || normalized == "on") {
            config.autoSolve = true;
            return true;
        }
        if (normalized == "0" || normalized == "false" || normalized == "off") {
            config.autoSolve = false;
            return true;
        }
        return false;
    });

    qCDebug(logEngineConfig) << "Engine config: tolerance=" << config.solver.tolerance
                             << "maxBranches=" << config.solver.maxBranches
                             << "maxCascadeSteps=" << config.maxCascadeSteps
                             << "autoSolve=" << config.autoSolve;
    return config;
}

bool approximatelyEqual(double a, double b, double tolerance) {
    const double diff = std::fabs(a - b);
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return diff <= tolerance * scale;
}

} // namespace geodeduce::core

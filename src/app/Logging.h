/**
 * @file Logging.h
 * @brief Qt message handler bootstrap for GeoDeduce executables and tests.
 *
 * Categories used by the engine live under "geodeduce.*". Environment:
 *  - GEODEDUCE_LOG_DEBUG: enable debug output for every engine category.
 *  - GEODEDUCE_LOG_DEBUG_CATEGORIES: comma separated categories to debug.
 *  - GEODEDUCE_LOG_DIR: also append formatted records to a file there.
 */
#ifndef GEODEDUCE_APP_LOGGING_H
#define GEODEDUCE_APP_LOGGING_H

#include <QString>

namespace geodeduce::app {

class Logging {
public:
    static bool initialize(const QString& appName, bool debugBuild);
    static void shutdown();
    static QString logFilePath();
    static bool isDebugLoggingEnabled();

    /**
     * @brief Filter rules derived from the build flavour and the environment.
     */
    static QString filterRules(bool debugBuild);

private:
    Logging() = delete;
};

} // namespace geodeduce::app

#endif // GEODEDUCE_APP_LOGGING_H

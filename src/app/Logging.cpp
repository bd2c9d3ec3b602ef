#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <QTextStream>

#include <cstdlib>
#include <iostream>

namespace geodeduce::app {
namespace {

QMutex gLogMutex;
QFile gLogFile;
QString gLogFilePath;
QtMessageHandler gPreviousHandler = nullptr;
bool gInitialized = false;
bool gDebugLoggingEnabled = false;

const char* levelToString(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

bool isEnabledFlag(QStringView value) {
    const QString normalized = value.toString().trimmed().toLower();
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

QStringList configuredDebugCategories() {
    const QString configured = qEnvironmentVariable("GEODEDUCE_LOG_DEBUG_CATEGORIES").trimmed();

    QStringList categories;
    for (const QString& token : configured.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty()) {
            categories.push_back(category);
        }
    }
    categories.removeDuplicates();
    return categories;
}

QString formatMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    const QString location = (context.file && context.line > 0)
                                 ? QStringLiteral("%1:%2").arg(QFileInfo(QString::fromUtf8(context.file)).fileName())
                                                          .arg(context.line)
                                 : QStringLiteral("<unknown>");
    const QString category = context.category ? QString::fromUtf8(context.category) : QStringLiteral("default");

    return QStringLiteral("%1 [%2] [%3] [%4] %5")
        .arg(timestamp, QString::fromLatin1(levelToString(type)), category, location, msg);
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString formatted = formatMessage(type, context, msg);

    {
        QMutexLocker lock(&gLogMutex);
        if (gLogFile.isOpen()) {
            QTextStream stream(&gLogFile);
            stream << formatted << Qt::endl;
        }
    }

    if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
        std::cerr << formatted.toStdString() << std::endl;
    } else {
        std::cout << formatted.toStdString() << std::endl;
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
}

} // namespace

QString Logging::filterRules(bool debugBuild) {
    const bool debugAll = debugBuild || isEnabledFlag(qEnvironmentVariable("GEODEDUCE_LOG_DEBUG"));

    QStringList rules;
    rules << QStringLiteral("*.info=false");
    rules << QStringLiteral("default.info=true");
    rules << QStringLiteral("geodeduce.info=true");
    rules << QStringLiteral("geodeduce.*.info=true");
    rules << QStringLiteral("*.warning=true");
    rules << QStringLiteral("*.critical=true");
    rules << QStringLiteral("*.debug=false");

    if (debugAll) {
        rules << QStringLiteral("geodeduce.debug=true");
        rules << QStringLiteral("geodeduce.*.debug=true");
    } else {
        for (const QString& category : configuredDebugCategories()) {
            rules << QStringLiteral("%1.debug=true").arg(category);
            rules << QStringLiteral("%1.*.debug=true").arg(category);
        }
    }
    return rules.join('\n');
}

bool Logging::initialize(const QString& appName, bool debugBuild) {
    QString openedPath;
    QString failedPath;

    {
        QMutexLocker lock(&gLogMutex);
        if (gInitialized) {
            return true;
        }

        gDebugLoggingEnabled = debugBuild || isEnabledFlag(qEnvironmentVariable("GEODEDUCE_LOG_DEBUG"));
        QLoggingCategory::setFilterRules(filterRules(debugBuild));

        const QString logDir = qEnvironmentVariable("GEODEDUCE_LOG_DIR").trimmed();
        if (!logDir.isEmpty()) {
            QDir dir(QDir::cleanPath(logDir));
            const QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz"));
            const QString fileName = QStringLiteral("%1_%2_%3.log")
                                         .arg(appName.toLower(), timestamp)
                                         .arg(QCoreApplication::applicationPid());
            const QString candidatePath = dir.filePath(fileName);

            if (dir.mkpath(QStringLiteral("."))) {
                gLogFile.setFileName(candidatePath);
                if (gLogFile.open(QIODevice::WriteOnly | QIODevice::Text)) {
                    gLogFilePath = candidatePath;
                    openedPath = candidatePath;
                }
            }
            if (openedPath.isEmpty()) {
                failedPath = candidatePath;
            }
        }

        gPreviousHandler = qInstallMessageHandler(messageHandler);
        gInitialized = true;
    }

    if (!failedPath.isEmpty()) {
        qWarning().noquote() << "Failed to open log file" << failedPath << "- console logging only";
    }

    qInfo().noquote() << "Logging initialized"
                      << "app=" << appName
                      << "logFile=" << (openedPath.isEmpty() ? QStringLiteral("<disabled>") : openedPath)
                      << "debugLogsEnabled=" << gDebugLoggingEnabled;
    return true;
}

void Logging::shutdown() {
    QMutexLocker lock(&gLogMutex);
    if (!gInitialized) {
        return;
    }

    qInstallMessageHandler(gPreviousHandler);
    gPreviousHandler = nullptr;

    if (gLogFile.isOpen()) {
        gLogFile.flush();
        gLogFile.close();
    }

    gLogFilePath.clear();
    gInitialized = false;
}

QString Logging::logFilePath() {
    QMutexLocker lock(&gLogMutex);
    return gLogFilePath;
}

bool Logging::isDebugLoggingEnabled() {
    QMutexLocker lock(&gLogMutex);
    return gDebugLoggingEnabled;
}

} // namespace geodeduce::app

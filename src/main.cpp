/*
    SPDX-FileCopyrightText: 2026 Synk contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QSettings>

#include "backend/GatewayBackend.h"
#include "widgets/WorkspaceWindow.h"
#include "workspace/WorkspaceController.h"
#include "workspace/WorkspaceSettings.h"

#include <cstdio>

using namespace Synk;

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Synk"));
    app.setApplicationName(QStringLiteral("synk"));
    app.setApplicationDisplayName(QStringLiteral("Synk"));
    app.setApplicationVersion(QStringLiteral(SYNK_VERSION_STRING));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Grid workspace for concurrently running terminal sessions"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption backendOption(QStringLiteral("backend"), QStringLiteral("Session backend executable."), QStringLiteral("program"));
    const QCommandLineOption backendArgOption(QStringLiteral("backend-arg"),
                                              QStringLiteral("Argument passed to the session backend (repeatable)."),
                                              QStringLiteral("argument"));
    const QCommandLineOption exitMethodOption(QStringLiteral("exit-method"),
                                              QStringLiteral("Terminal exit gesture: double_escape, ctrl_backslash or ctrl_shift_escape."),
                                              QStringLiteral("method"));
    const QCommandLineOption maxSessionsOption(QStringLiteral("max-sessions"), QStringLiteral("Maximum number of sessions (1-12)."), QStringLiteral("count"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Enable debug logging."));
    parser.addOptions({backendOption, backendArgOption, exitMethodOption, maxSessionsOption, verboseOption});
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("synk.*.debug=true\nsynk.*.info=true"));
    }

    QSettings settings;
    WorkspaceSettings workspaceSettings = WorkspaceSettings::load(settings);

    if (parser.isSet(backendOption)) {
        workspaceSettings.backendProgram = parser.value(backendOption);
        workspaceSettings.backendArguments = parser.values(backendArgOption);
    }
    if (parser.isSet(exitMethodOption)) {
        const auto method = WorkspaceSettings::exitMethodFromName(parser.value(exitMethodOption));
        if (!method) {
            std::fprintf(stderr, "synk: unknown exit method '%s'\n", qPrintable(parser.value(exitMethodOption)));
            return 1;
        }
        workspaceSettings.terminalExitMethod = *method;
    }
    if (parser.isSet(maxSessionsOption)) {
        bool ok = false;
        const int count = parser.value(maxSessionsOption).toInt(&ok);
        if (!ok || count < 1 || count > GridLayout::MaxPanes) {
            std::fprintf(stderr, "synk: --max-sessions expects a number between 1 and %d\n", GridLayout::MaxPanes);
            return 1;
        }
        workspaceSettings.maxActiveSessions = count;
    }

    if (!settings.contains(QStringLiteral("keyboard/terminalExitMethod"))) {
        WorkspaceSettings::load(settings).save(settings);
    }

    GatewayBackend backend;
    WorkspaceWindow window(&backend, workspaceSettings);
    window.show();

    if (backend.start(workspaceSettings.backendProgram, workspaceSettings.backendArguments)) {
        window.controller()->initialize();
    }

    return app.exec();
}

#include "mainwindow.hpp"

#include "soberlauncher/debug.hpp"
#include "soberlauncher/qt-debug.hpp"
#include "soberlauncher/instancecontroller.hpp"
#include "soberlauncher/launchpolicy.hpp"
#include "soberlauncher/paths.hpp"
#include "soberlauncher/settings.hpp"
#include "soberlauncher/util.hpp"
#include <QApplication>
#include <QColor>
#include <QIcon>
#include <QMessageBox>
#include <QObject>
#include <QPalette>
#include <QString>
#include <csignal>
#include <cstdlib>

namespace {

// Without an icon theme the desktop gives us nothing to match; use a dark
// Fusion palette instead of the bare default.
void
apply_fallback_theme(QApplication &app)
{
    if (!QIcon::themeName().isEmpty())
        return;

    app.setStyle("Fusion");
    QPalette palette;

    const QColor dark_gray(30, 30, 30);
    const QColor mid_gray(45, 45, 45);
    const QColor text_gray(220, 220, 220);
    const QColor blue("#1e3a8a");

    palette.setColor(QPalette::Window, dark_gray);
    palette.setColor(QPalette::WindowText, text_gray);
    palette.setColor(QPalette::Base, QColor(25, 25, 25));
    palette.setColor(QPalette::AlternateBase, mid_gray);
    palette.setColor(QPalette::ToolTipBase, mid_gray);
    palette.setColor(QPalette::ToolTipText, text_gray);
    palette.setColor(QPalette::Text, text_gray);
    palette.setColor(QPalette::Button, mid_gray);
    palette.setColor(QPalette::ButtonText, text_gray);
    palette.setColor(QPalette::Highlight, blue);
    palette.setColor(QPalette::HighlightedText, Qt::white);

    app.setPalette(palette);
    DEBUG_LOG("[main] no icon theme, fallback palette applied");
}

// Gamescope / Steam Deck sessions get a fullscreen window
bool
wants_fullscreen()
{
    const char *desktop = std::getenv("XDG_CURRENT_DESKTOP");
    const char *steamdeck = std::getenv("STEAMDECK");
    return (desktop && sl_util::to_lower(desktop).find("gamescope") != std::string::npos)
        || (steamdeck && std::string(steamdeck) == "1");
}

} // namespace

int
main(int argc, char *argv[])
{
    signal(SIGPIPE, SIG_IGN);
    QApplication app(argc, argv);
    app.setApplicationName("Sober Launcher");
    app.setDesktopFileName(QString::fromStdString(sl_mgmt::launcher_app_id));
    DEBUG_LOG("[main] QApplication started, argc:", argc);

    apply_fallback_theme(app);

    // --- Check if flatpak exists ---
    if (sl_util::which("flatpak").empty()) {
        QMessageBox msgBox;
        msgBox.setWindowTitle(QObject::tr("Flatpak not found"));

        QString text = QObject::tr("Flatpak is not installed in your system.\nSober is installed from: ");
        QString link = "<a href=\"https://sober.vinegarhq.org\">https://sober.vinegarhq.org</a>";

        msgBox.setTextFormat(Qt::RichText);
        msgBox.setTextInteractionFlags(Qt::TextBrowserInteraction);
        msgBox.setText(text + link);

        msgBox.exec();
        DEBUG_LOG("[main] flatpak not found, exiting program.");
        return 1;
    }

    std::string data_root = sl_mgmt::resolve_data_root();
    if (!sl_util::is_directory(data_root)) {
        qCritical("Cannot use data directory %s", data_root.c_str());
        QMessageBox::critical(nullptr, QObject::tr("Error"),
                              QObject::tr("Cannot create the data directory:\n%1")
                              .arg(QString::fromStdString(data_root)));
        return 1;
    }

    std::string settings_file = sl_mgmt::settings_path(data_root);
    sl_mgmt::settings_record settings = sl_mgmt::settings::load(settings_file);

    sl_mgmt::launch_target target = sl_mgmt::launch_target::sober();
    sl_mgmt::instance_controller controller(settings, data_root, target,
                                            sl_mgmt::default_instance_probes(target.identity));

    MainWindow w(controller, settings, data_root, settings_file);
    DEBUG_LOG("[main] MainWindow created, showing...");
    if (wants_fullscreen())
        w.showFullScreen();
    else
        w.showMaximized();

    int exitCode = app.exec();
    DEBUG_LOG("[main] QApplication exec returned, exit code:", exitCode);
    return exitCode;
}

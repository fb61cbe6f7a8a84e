#include "soberlauncher/debug.hpp"
#include "soberlauncher/qt-debug.hpp"
#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/profiledata.hpp"
#include "createprofiledialog.hpp"
#include "mainwindow.hpp"
#include <QDesktopServices>
#include <QInputDialog>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QUrl>
#include <string>

namespace {

QString
join_profiles(const profile_list &profiles)
{
    QStringList names;
    for (const auto &p : profiles)
        names << QString::fromStdString(p);
    return names.join(", ");
}

} // namespace

void
MainWindow::report_launch(const sl_mgmt::launch_report &report)
{
    using sl_mgmt::request_status;
    const QString text = QString::fromStdString(sl_mgmt::describe(report.status));

    switch (report.status) {
        case request_status::ok:
            if (!report.launched.empty())
                set_temporal_status_message(tr("Launched: %1").arg(join_profiles(report.launched)), 5000);
            else if (!report.already_running.empty())
                set_temporal_status_message(tr("Already running: %1").arg(join_profiles(report.already_running)), 5000);
            break;

        case request_status::no_selection:
        case request_status::invalid_link:
            QMessageBox::warning(this, tr("Error"), text);
            break;

        case request_status::rejected_by_policy:
            QMessageBox::warning(this, tr("Error"),
                                 tr("A Profile is already running, try closing it before opening a new one"));
            break;

        case request_status::multi_instance_disabled:
        case request_status::nothing_missing:
            QMessageBox::information(this, tr("Info"), text);
            break;

        case request_status::spawn_failures: {
            QStringList lines;
            for (const auto &f : report.failures)
                lines << QString::fromStdString(f.first + ": " + f.second);
            QMessageBox::warning(this, tr("Launch failed"), text + "\n- " + lines.join("\n- "));
            break;
        }
    }

    update_missing_instances(controller.missing());
}

void
MainWindow::handle_launch()
{
    report_launch(controller.launch(selected_profiles()));
}

void
MainWindow::handle_launch_with_console()
{
    sl_mgmt::launch_options options;
    options.with_console = true;
    report_launch(controller.launch(selected_profiles(), options));
}

void
MainWindow::handle_launch_game_link()
{
    profile_list targets = selected_profiles();
    if (targets.empty()) {
        report_launch(controller.launch(targets));
        return;
    }

    bool ok = false;
    QString url = QInputDialog::getText(this, tr("Game Link"), tr("Enter the game link:"),
                                        QLineEdit::Normal, QString(), &ok);
    if (!ok || url.trimmed().isEmpty())
        return;

    report_launch(controller.launch_with_link(targets, url.toStdString()));
}

void
MainWindow::handle_launch_main_profile()
{
    report_launch(controller.launch({sl_mgmt::main_profile}));
}

void
MainWindow::handle_run_missing()
{
    report_launch(controller.run_missing());
}

void
MainWindow::handle_run_missing_with_link()
{
    // Don't ask for a link that can't be used
    if (!settings.allow_multi_instance || controller.missing().empty()) {
        report_launch(controller.run_missing());
        return;
    }

    bool ok = false;
    QString url = QInputDialog::getText(this, tr("Game Link"),
                                        tr("Enter the game link for all missing instances:"),
                                        QLineEdit::Normal, QString(), &ok);
    if (!ok || url.trimmed().isEmpty())
        return;

    report_launch(controller.run_missing_with_link(url.toStdString()));
}

void
MainWindow::handle_exit_all()
{
    QMessageBox::StandardButton reply = QMessageBox::question(
        this,
        tr("Confirm Exit"),
        tr("Do you want to force-close all Sober sessions?"),
        QMessageBox::Yes | QMessageBox::No
    );

    if (reply != QMessageBox::Yes)
        return;

    controller.exit_all();
    update_missing_instances(controller.missing());
    QMessageBox::information(this, tr("Exit"), tr("All Sober sessions have been forcibly closed."));
}

void
MainWindow::handle_create_profile()
{
    CreateProfileDialog dlg(this);
    if (dlg.exec() != QDialog::Accepted)
        return;

    QString name = dlg.profile_name();
    std::string error;
    if (!sl_mgmt::profiles::create_profile(data_root, name.toStdString(), error)) {
        QMessageBox::warning(this, tr("Error"), QString::fromStdString(error));
        return;
    }

    if (dlg.copy_main_profile()) {
        start_profile_copy(name);
        return;
    }

    refresh_profiles();
    QMessageBox::information(this, tr("Profile Created"), tr("Profile '%1' created successfully!").arg(name));
}

/*
  The copy can take minutes, so it runs on the thread pool while the window
  is disabled. It only touches the filesystem; the result comes back to the
  GUI thread through the watcher.
*/
void
MainWindow::start_profile_copy(const QString &profile)
{
    const std::string identity = controller.supervisor().target().identity;
    const std::string src = sl_mgmt::profiles::app_data_dir(data_root, sl_mgmt::main_profile, identity);
    const std::string dst = sl_mgmt::profiles::profile_path(data_root, profile.toStdString());

    DEBUG_LOG("[MainWindow] copying ", src, " into ", dst);
    setEnabled(false);
    set_temporal_status_message(tr("Copying the main profile into '%1'...").arg(profile), 600000);

    QFuture<QString> future = QtConcurrent::run([src, dst]() -> QString {
        std::string error;
        if (!sl_mgmt::profiles::copy_main_profile_data(src, dst, error))
            return QString::fromStdString(error);
        return QString();
    });

    copy_watcher = new QFutureWatcher<QString>(this);
    QFutureWatcher<QString> *watcher = copy_watcher;
    connect(watcher, &QFutureWatcher<QString>::finished, this, [this, watcher, profile]() {
        QString error = watcher->result();
        watcher->deleteLater();
        if (copy_watcher == watcher)
            copy_watcher = nullptr;

        setEnabled(true);
        statusBar->clearMessage();
        refresh_profiles();

        if (error.isEmpty()) {
            QMessageBox::information(this, tr("Profile Created"),
                                     tr("Profile '%1' created successfully!").arg(profile));
        } else {
            QMessageBox::critical(this, tr("Copy Failed"),
                                  tr("Could not copy main profile data:\n%1").arg(error));
        }
    });

    watcher->setFuture(future);
}

void
MainWindow::handle_fix_profiles()
{
    profile_list targets = selected_profiles();
    if (targets.empty()) {
        QMessageBox::information(this, tr("Info"), tr("Select at least one profile to fix."));
        return;
    }

    QMessageBox msg(this);
    msg.setWindowTitle(tr("Fix Profiles"));
    msg.setText(tr("Which fix method would you prefer?"));
    QPushButton *delete_btn = msg.addButton(tr("Delete local files (keeps the data, normally)"),
                                            QMessageBox::AcceptRole);
    msg.addButton(tr("Exit"), QMessageBox::RejectRole);
    msg.setIcon(QMessageBox::Question);
    msg.exec();

    if (msg.clickedButton() != delete_btn)
        return;

    const std::string identity = controller.supervisor().target().identity;
    QStringList failures;
    for (const auto &profile : targets) {
        std::vector<std::string> errors;
        if (!sl_mgmt::profiles::fix_profile(data_root, profile, identity, errors)) {
            for (const auto &e : errors)
                failures << QString::fromStdString(profile + ": " + e);
        }
    }

    if (!failures.isEmpty()) {
        QMessageBox::warning(this, tr("Fix Completed with Errors"),
                             tr("Some profiles could not be fully fixed:") + "\n- " + failures.join("\n- "));
    } else {
        QMessageBox::information(this, tr("Fix Completed"), tr("Selected profiles were fixed successfully."));
    }
}

void
MainWindow::handle_open_folder()
{
    refresh_profiles();
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(QString::fromStdString(data_root)))) {
        set_temporal_status_message(tr("Could not open %1").arg(QString::fromStdString(data_root)), 5000);
    }
}

void
MainWindow::handle_multi_instance_toggled(bool checked)
{
    settings.allow_multi_instance = checked;
    save_settings();
    apply_multi_instance_state();
}

void
MainWindow::handle_player_tab_toggled(bool checked)
{
    settings.roblox_player_enabled = checked;
    save_settings();
    update_player_tab_visibility();
}

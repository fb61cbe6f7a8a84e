#include "soberlauncher/debug.hpp"
#include "soberlauncher/paths.hpp"
#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/profiledata.hpp"
#include "mainwindow.hpp"
#include <QIcon>
#include <QMenu>
#include <QMessageBox>
#include <string>

void
MainWindow::set_temporal_status_message(const QString message, qint64 duration_in_ms)
{
    if (!statusBar)
        return;

    // Cache current message
    QString cached_status = statusBar->currentMessage();

    statusBar->showMessage(message);

    // Restore afterwards, unless someone else wrote in the meantime
    QTimer::singleShot(duration_in_ms, this, [this, cached_status, message]() {
        if (!statusBar) return;
        if (statusBar->currentMessage() == message) {
            statusBar->showMessage(cached_status);
        }
    });
}

void
MainWindow::show_profile_context_menu(const QPoint &pos)
{
    QListWidgetItem *item = profile_list_widget->itemAt(pos);
    if (!item)
        return;

    QString profile = item->text();

    QMenu menu;
    QAction *add_act = menu.addAction(QIcon::fromTheme("document-new"), tr("Add to desktop entry"));
    QAction *remove_act = menu.addAction(QIcon::fromTheme("user-trash"), tr("Remove Profile"));
    remove_act->setEnabled(!sl_mgmt::profiles::is_main_profile(profile.toStdString()));

    QAction *chosen = menu.exec(profile_list_widget->mapToGlobal(pos));
    if (chosen == add_act)
        create_desktop_entry(profile);
    else if (chosen == remove_act)
        remove_profile(profile);
}

void
MainWindow::create_desktop_entry(const QString &profile)
{
    std::string name = profile.toStdString();
    std::string written, error;

    bool ok = sl_mgmt::profiles::write_desktop_entry(
        name,
        sl_mgmt::profiles::desktop_entry_dir(),
        controller.supervisor().shell_command_line(name),
        sl_mgmt::launcher_app_id,
        written,
        error
    );

    if (ok) {
        QMessageBox::information(this, tr("Desktop Entry"), tr("Created %1").arg(QString::fromStdString(written)));
    } else {
        QMessageBox::critical(this, tr("Desktop Entry"), QString::fromStdString(error));
    }
}

void
MainWindow::remove_profile(const QString &profile)
{
    if (sl_mgmt::profiles::is_main_profile(profile.toStdString())) {
        QMessageBox::warning(this, tr("Protected"),
                             tr("Cannot remove '%1'.").arg(QString::fromStdString(sl_mgmt::main_profile)));
        return;
    }

    QMessageBox::StandardButton reply = QMessageBox::question(
        this,
        tr("Remove Profile"),
        tr("Are you sure you want to remove profile '%1'?\nThis will delete its folder.").arg(profile),
        QMessageBox::Yes | QMessageBox::No,
        QMessageBox::No
    );

    if (reply != QMessageBox::Yes)
        return;

    std::string error;
    if (!controller.remove_profile(profile.toStdString(), error)) {
        QMessageBox::critical(this, tr("Remove Profile"), QString::fromStdString(error));
        return;
    }

    refresh_profiles();
    QMessageBox::information(this, tr("Remove Profile"), tr("Profile '%1' removed.").arg(profile));
}

// privateservers.cpp
//
// Roblox Player tab: display name, private server buttons and quick launch.
// These launches are untracked and run against the real HOME.

#include "soberlauncher/debug.hpp"
#include "soberlauncher/qt-debug.hpp"
#include "mainwindow.hpp"
#include <QInputDialog>
#include <QLayoutItem>
#include <QLineEdit>
#include <QIcon>
#include <QMenu>
#include <QMessageBox>

namespace {

// Name then parameter, both non-empty. Returns false if the user gave up.
bool
ask_private_server(QWidget *parent, const QString &title_prefix,
                   QString &name, QString &parameter)
{
    bool ok = false;
    name = QInputDialog::getText(parent, title_prefix + QObject::tr("Private Server Name"),
                                 QObject::tr("Enter a name for the private server:"),
                                 QLineEdit::Normal, name, &ok).trimmed();
    if (!ok || name.isEmpty())
        return false;

    parameter = QInputDialog::getText(parent, title_prefix + QObject::tr("Parameter"),
                                      QObject::tr("Enter the parameter:"),
                                      QLineEdit::Normal, parameter, &ok).trimmed();
    return ok && !parameter.isEmpty();
}

} // namespace

void
MainWindow::refresh_private_server_buttons()
{
    while (QLayoutItem *item = private_servers_layout->takeAt(0)) {
        if (QWidget *w = item->widget())
            w->deleteLater();
        delete item;
    }

    for (const auto &server : settings.private_servers) {
        const QString name = QString::fromStdString(server.name);
        const QString parameter = QString::fromStdString(server.parameter);

        QPushButton *btn = new QPushButton(name, player_tab);
        btn->setMinimumWidth(120);
        btn->setToolTip(parameter);
        btn->setContextMenuPolicy(Qt::CustomContextMenu);

        connect(btn, &QPushButton::clicked, this, [this, parameter]() {
            run_parameter(parameter);
        });
        connect(btn, &QPushButton::customContextMenuRequested, this, [this, btn, name](const QPoint &) {
            QMenu menu;
            QAction *remove_act = menu.addAction(QIcon::fromTheme("list-remove"), tr("Remove"));
            QAction *edit_act = menu.addAction(QIcon::fromTheme("document-edit"), tr("Edit"));
            QAction *chosen = menu.exec(btn->mapToGlobal(btn->rect().bottomLeft()));
            if (chosen == remove_act)
                remove_private_server(name);
            else if (chosen == edit_act)
                edit_private_server(name);
        });

        private_servers_layout->addWidget(btn);
    }
}

void
MainWindow::add_private_server()
{
    QString name, parameter;
    if (!ask_private_server(this, QString(), name, parameter))
        return;

    if (!sl_mgmt::settings::add_private_server(settings, name.toStdString(), parameter.toStdString())) {
        QMessageBox::warning(this, tr("Error"), tr("A private server named '%1' already exists.").arg(name));
        return;
    }

    save_settings();
    refresh_private_server_buttons();
}

void
MainWindow::edit_private_server(const QString &old_name)
{
    QString name = old_name;
    QString parameter;
    for (const auto &server : settings.private_servers) {
        if (server.name == old_name.toStdString())
            parameter = QString::fromStdString(server.parameter);
    }

    if (!ask_private_server(this, tr("Edit "), name, parameter))
        return;

    if (!sl_mgmt::settings::edit_private_server(settings, old_name.toStdString(),
                                                name.toStdString(), parameter.toStdString())) {
        QMessageBox::warning(this, tr("Error"), tr("A private server named '%1' already exists.").arg(name));
        return;
    }

    save_settings();
    refresh_private_server_buttons();
}

void
MainWindow::remove_private_server(const QString &name)
{
    if (sl_mgmt::settings::remove_private_server(settings, name.toStdString())) {
        save_settings();
        refresh_private_server_buttons();
    }
}

void
MainWindow::run_parameter(const QString &parameter)
{
    DEBUG_LOG("[MainWindow] untracked launch with ", parameter);
    sl_mgmt::launch_result r = controller.supervisor().spawn_detached(parameter.toStdString());
    if (!r.ok())
        QMessageBox::warning(this, tr("Launch failed"), QString::fromStdString(r.error));
}

void
MainWindow::handle_quick_launch()
{
    bool ok = false;
    QString parameter = QInputDialog::getText(this, tr("Parameter"), tr("Enter the parameter:"),
                                              QLineEdit::Normal, QString(), &ok).trimmed();
    if (!ok || parameter.isEmpty())
        return;

    run_parameter(parameter);
}

void
MainWindow::handle_edit_display_name()
{
    bool ok = false;
    QString name = QInputDialog::getText(this, tr("Edit Name"), tr("Enter your name:"),
                                         QLineEdit::Normal,
                                         QString::fromStdString(settings.display_name), &ok).trimmed();
    if (!ok || name.isEmpty())
        return;

    settings.display_name = name.toStdString();
    display_name_label->setText(tr("Hi, %1").arg(name));
    save_settings();
}

// mainwindow.cpp
//
// Main window for the Sober Launcher UI. The profile list is rebuilt from
// disk on refresh; liveness comes from the controller, which is ticked by
// a timer at the configured poll interval.

#include "soberlauncher/debug.hpp"
#include "soberlauncher/qt-debug.hpp"
#include "soberlauncher/paths.hpp"
#include "soberlauncher/profilecatalog.hpp"

#include "mainwindow.hpp"

#include "help/helpdialog.hpp"
#include "help/texts.hpp"

#include <QAbstractItemView>
#include <QApplication>
#include <QBrush>
#include <QColor>
#include <QFont>
#include <QIcon>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPalette>
#include <QSignalBlocker>
#include <QSizePolicy>
#include <QTabBar>
#include <QVBoxLayout>
#include <algorithm>
#include <utility>

namespace {

// Missing profiles are painted with this
const QColor missing_colour("#1e3a8a");

} // namespace

MainWindow
::MainWindow(sl_mgmt::instance_controller &controller,
             sl_mgmt::settings_record &settings,
             std::string data_root,
             std::string settings_path,
             QWidget *parent)
    : QMainWindow(parent)
    , controller(controller)
    , settings(settings)
    , data_root(std::move(data_root))
    , settings_file(std::move(settings_path))
{
    setup_ui();
    refresh_profiles();
    refresh_private_server_buttons();
    apply_multi_instance_state();
    update_player_tab_visibility();

    tick_timer = new QTimer(this);
    connect(tick_timer, &QTimer::timeout, this, &MainWindow::on_tick);
    tick_timer->start(controller.poll_interval_ms());
    DEBUG_LOG("[MainWindow] polling every ", controller.poll_interval_ms(), " ms");
}

void
MainWindow::setup_ui()
{
    setWindowTitle(tr("Sober Launcher"));
    setWindowIcon(QIcon::fromTheme(QString::fromStdString(sl_mgmt::launcher_app_id)));

    main_tabs = new QTabWidget(this);
    main_tabs->addTab(build_instances_tab(), tr("Instances"));
    player_tab = build_player_tab();
    player_tab->hide();

    setCentralWidget(main_tabs);
    resize(900, 560);

    // --- FILE ---
    QMenu *file_menu = menuBar()->addMenu(tr("&File"));
    file_menu->setObjectName("fileMenu");

    QAction *open_act = file_menu->addAction(QIcon::fromTheme("folder-open"), tr("Open profiles folder"));
    connect(open_act, &QAction::triggered, this, &MainWindow::handle_open_folder);

    QAction *quit_act = file_menu->addAction(QIcon::fromTheme("application-exit"), tr("Quit"));
    connect(quit_act, &QAction::triggered, this, &QWidget::close);

    // --- SETTINGS ---
    QMenu *settings_menu = menuBar()->addMenu(tr("&Settings"));
    player_tab_act = settings_menu->addAction(tr("Activate Roblox Player stuff"));
    player_tab_act->setCheckable(true);
    player_tab_act->setChecked(settings.roblox_player_enabled);
    connect(player_tab_act, &QAction::toggled, this, &MainWindow::handle_player_tab_toggled);

    // --- HELP ---
    QMenu *help_menu = menuBar()->addMenu(tr("&Help"));
    help_menu->setObjectName("helpMenu");

    QAction *usage_act = help_menu->addAction(QIcon::fromTheme("help-contents"), tr("Profiles and instances"));
    connect(usage_act, &QAction::triggered, this, [this]() {
        help_dialog *dlg = new help_dialog(this, tr("Profiles and instances"), helptexts().profiles_and_instances());
        dlg->setAttribute(Qt::WA_DeleteOnClose);
        dlg->exec();
    });

    QAction *about_act = help_menu->addAction(QIcon::fromTheme("help-about"), tr("About Sober Launcher"));
    connect(about_act, &QAction::triggered, this, [this]() {
        help_dialog *dlg = new help_dialog(this, tr("About Sober Launcher"), helptexts().about());
        dlg->setAttribute(Qt::WA_DeleteOnClose);
        dlg->exec();
    });
    // --- END HELP ---

    statusBar = new QStatusBar(this);
    setStatusBar(statusBar);
}

QWidget *
MainWindow::build_instances_tab()
{
    QWidget *tab = new QWidget(this);
    QVBoxLayout *tab_layout = new QVBoxLayout(tab);

    // --- Toolbar
    QHBoxLayout *toolbar = new QHBoxLayout();

    open_folder_btn = new QPushButton(QIcon::fromTheme("folder-open"), tr("Open Folder"));
    refresh_btn = new QPushButton(QIcon::fromTheme("view-refresh"), "");
    refresh_btn->setToolTip(tr("Refresh profiles"));
    create_btn = new QPushButton(QIcon::fromTheme("list-add"), tr("Create Profile"));
    exit_all_btn = new QPushButton(QIcon::fromTheme("process-stop"), "");
    multi_instance_check = new QCheckBox(tr("Multi-instance"));
    multi_instance_check->setToolTip(tr("Allow running several profiles at the same time"));
    multi_instance_check->setChecked(settings.allow_multi_instance);

    toolbar->addWidget(open_folder_btn);
    toolbar->addWidget(refresh_btn);
    toolbar->addWidget(create_btn);
    toolbar->addWidget(exit_all_btn);
    toolbar->addStretch();
    toolbar->addWidget(multi_instance_check);
    tab_layout->addLayout(toolbar);

    connect(open_folder_btn, &QPushButton::clicked, this, &MainWindow::handle_open_folder);
    connect(refresh_btn, &QPushButton::clicked, this, &MainWindow::refresh_profiles);
    connect(create_btn, &QPushButton::clicked, this, &MainWindow::handle_create_profile);
    connect(exit_all_btn, &QPushButton::clicked, this, &MainWindow::handle_exit_all);
    connect(multi_instance_check, &QCheckBox::toggled, this, &MainWindow::handle_multi_instance_toggled);

    // --- Profile list + action panel
    QHBoxLayout *body = new QHBoxLayout();

    profile_list_widget = new QListWidget(tab);
    profile_list_widget->setSelectionMode(QAbstractItemView::ExtendedSelection);
    profile_list_widget->setContextMenuPolicy(Qt::CustomContextMenu);
    connect(profile_list_widget, &QListWidget::itemSelectionChanged, this, &MainWindow::update_selected_label);
    connect(profile_list_widget, &QListWidget::customContextMenuRequested,
            this, &MainWindow::show_profile_context_menu);
    body->addWidget(profile_list_widget, 1);

    QWidget *panel = new QWidget(tab);
    QVBoxLayout *panel_layout = new QVBoxLayout(panel);
    panel_layout->setContentsMargins(0, 0, 0, 0);
    panel_layout->setSpacing(10);

    selected_label = new QLabel(panel);
    selected_label->setWordWrap(true);
    selected_label->setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Preferred);
    panel_layout->addWidget(selected_label);

    launch_btn = new QPushButton(QIcon::fromTheme("media-playback-start"), tr("Launch Game"), panel);
    console_btn = new QPushButton(QIcon::fromTheme("utilities-terminal"), tr("Run with Console"), panel);
    game_link_btn = new QPushButton(QIcon::fromTheme("internet-web-browser"), tr("Run Specific Game"), panel);
    main_profile_btn = new QPushButton(QIcon::fromTheme("user-home"), tr("Launch Main Profile"), panel);
    fix_btn = new QPushButton(QIcon::fromTheme("tools-check-spelling"), tr("Fix"), panel);
    fix_btn->setToolTip(tr("Fix selected profiles (delete local files)"));

    panel_layout->addWidget(launch_btn);
    panel_layout->addWidget(console_btn);
    panel_layout->addWidget(game_link_btn);
    panel_layout->addWidget(main_profile_btn);
    panel_layout->addWidget(fix_btn);
    panel_layout->addStretch();
    panel->setFixedWidth(300);
    body->addWidget(panel);

    connect(launch_btn, &QPushButton::clicked, this, &MainWindow::handle_launch);
    connect(console_btn, &QPushButton::clicked, this, &MainWindow::handle_launch_with_console);
    connect(game_link_btn, &QPushButton::clicked, this, &MainWindow::handle_launch_game_link);
    connect(main_profile_btn, &QPushButton::clicked, this, &MainWindow::handle_launch_main_profile);
    connect(fix_btn, &QPushButton::clicked, this, &MainWindow::handle_fix_profiles);

    tab_layout->addLayout(body);

    // --- Missing instances bar (multi-instance only)
    missing_bar = new QWidget(tab);
    QHBoxLayout *missing_layout = new QHBoxLayout(missing_bar);
    missing_layout->setContentsMargins(0, 0, 0, 0);

    missing_label = new QLabel(missing_bar);
    missing_label->setWordWrap(true);
    missing_label->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);
    missing_layout->addWidget(missing_label);

    run_missing_btn = new QPushButton(tr("Run Missing Instances"), missing_bar);
    run_missing_link_btn = new QPushButton(QIcon::fromTheme("internet-web-browser"), "", missing_bar);
    run_missing_link_btn->setToolTip(tr("Run Missing Instances with Game Link"));
    missing_layout->addWidget(run_missing_btn);
    missing_layout->addWidget(run_missing_link_btn);

    connect(run_missing_btn, &QPushButton::clicked, this, &MainWindow::handle_run_missing);
    connect(run_missing_link_btn, &QPushButton::clicked, this, &MainWindow::handle_run_missing_with_link);

    tab_layout->addWidget(missing_bar);

    update_selected_label();
    return tab;
}

QWidget *
MainWindow::build_player_tab()
{
    QWidget *tab = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(tab);
    layout->addStretch(2);

    QHBoxLayout *name_row = new QHBoxLayout();
    display_name_label = new QLabel(tab);
    display_name_label->setAlignment(Qt::AlignHCenter | Qt::AlignVCenter);
    QFont f = display_name_label->font();
    f.setPointSize(32);
    f.setBold(true);
    display_name_label->setFont(f);
    display_name_label->setText(tr("Hi, %1").arg(QString::fromStdString(settings.display_name)));
    name_row->addWidget(display_name_label);

    QPushButton *edit_name_btn = new QPushButton(QIcon::fromTheme("document-edit"), "", tab);
    edit_name_btn->setFixedSize(32, 32);
    edit_name_btn->setToolTip(tr("Edit name"));
    connect(edit_name_btn, &QPushButton::clicked, this, &MainWindow::handle_edit_display_name);
    name_row->addWidget(edit_name_btn);
    name_row->addStretch(1);
    layout->addLayout(name_row);

    layout->addStretch(1);

    QPushButton *play_btn = new QPushButton(tr("Play"), tab);
    play_btn->setFixedHeight(60);
    play_btn->setStyleSheet("font-size: 20px;");
    connect(play_btn, &QPushButton::clicked, this, &MainWindow::handle_launch_main_profile);
    layout->addWidget(play_btn, 0, Qt::AlignHCenter | Qt::AlignVCenter);

    QHBoxLayout *button_row = new QHBoxLayout();
    QPushButton *add_server_btn = new QPushButton(QIcon::fromTheme("list-add"), tr("Add private server"), tab);
    QPushButton *quick_btn = new QPushButton(tr("Quick launch"), tab);
    connect(add_server_btn, &QPushButton::clicked, this, &MainWindow::add_private_server);
    connect(quick_btn, &QPushButton::clicked, this, &MainWindow::handle_quick_launch);
    button_row->addWidget(add_server_btn);
    button_row->addWidget(quick_btn);

    private_servers_layout = new QHBoxLayout();
    button_row->addLayout(private_servers_layout);
    button_row->addStretch(1);
    layout->addLayout(button_row);

    layout->addStretch(6);
    return tab;
}

void
MainWindow::refresh_profiles()
{
    // Keep the selection across rebuilds
    profile_list previously_selected = selected_profiles();

    QSignalBlocker blocker(profile_list_widget);
    profile_list_widget->clear();

    for (const auto &name : sl_mgmt::profiles::list(data_root)) {
        QListWidgetItem *item = new QListWidgetItem(QString::fromStdString(name), profile_list_widget);
        if (std::find(previously_selected.begin(), previously_selected.end(), name) != previously_selected.end())
            item->setSelected(true);
    }

    DEBUG_LOG("[MainWindow] profiles refreshed: ", profile_list_widget->count(), " entries");
    update_selected_label();
    update_missing_instances(controller.missing());
}

profile_list
MainWindow::selected_profiles() const
{
    profile_list selected;
    if (!profile_list_widget)
        return selected;

    // Keep list order, not click order
    for (int i = 0; i < profile_list_widget->count(); ++i) {
        QListWidgetItem *item = profile_list_widget->item(i);
        if (item->isSelected())
            selected.push_back(item->text().toStdString());
    }
    return selected;
}

void
MainWindow::update_selected_label()
{
    profile_list selected = selected_profiles();
    QStringList names;
    for (const auto &s : selected)
        names << QString::fromStdString(s);

    selected_label->setText(tr("Selected Profiles: %1")
                            .arg(names.isEmpty() ? tr("None") : names.join(", ")));
}

void
MainWindow::update_missing_instances(const profile_list &missing)
{
    // Nothing counts as missing while multi-instance is off
    const profile_list shown = settings.allow_multi_instance ? missing : profile_list{};

    QStringList names;
    for (const auto &m : shown)
        names << QString::fromStdString(m);

    QString text = tr("Launched instances not running: %1")
                   .arg(names.isEmpty() ? tr("None") : names.join(", "));

    // Shrink long lists instead of growing the bar
    QFont f = missing_label->font();
    const int base_size = 12;
    const int max_len = 60;
    if (text.size() > max_len)
        f.setPointSize(std::max(base_size - static_cast<int>((text.size() - max_len) / 8), 7));
    else
        f.setPointSize(base_size);
    missing_label->setFont(f);
    missing_label->setText(text);

    QColor default_colour = palette().color(QPalette::WindowText);
    for (int i = 0; i < profile_list_widget->count(); ++i) {
        QListWidgetItem *item = profile_list_widget->item(i);
        bool is_missing = std::find(shown.begin(), shown.end(), item->text().toStdString()) != shown.end();
        item->setForeground(QBrush(is_missing ? missing_colour : default_colour));
    }
}

void
MainWindow::apply_multi_instance_state()
{
    exit_all_btn->setText(settings.allow_multi_instance ? tr("Exit All Sessions") : tr("Exit Current Session"));
    missing_bar->setVisible(settings.allow_multi_instance);
    update_missing_instances(controller.missing());
}

void
MainWindow::update_player_tab_visibility()
{
    int idx = main_tabs->indexOf(player_tab);
    if (settings.roblox_player_enabled && idx == -1)
        main_tabs->addTab(player_tab, tr("Roblox Player"));
    else if (!settings.roblox_player_enabled && idx != -1) {
        main_tabs->removeTab(idx);
        player_tab->hide();
    }

    // A lone tab needs no tab bar
    main_tabs->tabBar()->setVisible(main_tabs->count() > 1);
}

void
MainWindow::on_tick()
{
    sl_mgmt::tick_report report = controller.tick();
    if (!report.exited.empty())
        DEBUG_LOG("[MainWindow] exited since last tick: ", report.exited);
    update_missing_instances(report.missing);
}

void
MainWindow::save_settings()
{
    std::string error;
    if (!sl_mgmt::settings::save(settings, settings_file, error)) {
        QMessageBox::critical(this, tr("Error"),
                              tr("Failed to save settings: %1").arg(QString::fromStdString(error)));
    }
}

#pragma once

#include "soberlauncher/instancecontroller.hpp"
#include "soberlauncher/settings.hpp"
#include <QCheckBox>
#include <QFutureWatcher>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMainWindow>
#include <QPushButton>
#include <QStatusBar>
#include <QString>
#include <QTabWidget>
#include <QTimer>
#include <QtConcurrent/QtConcurrent>
#include <string>

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /**
     * @brief The launcher window.
     *
     * Borrows the controller and the settings record it was built with;
     * both must outlive the window. Settings changes made here are saved
     * to settings_path right away.
     */
    MainWindow(sl_mgmt::instance_controller &controller,
               sl_mgmt::settings_record &settings,
               std::string data_root,
               std::string settings_path,
               QWidget *parent = nullptr);

    // Set a temporal message on the status bar for an amount of time
    void set_temporal_status_message(const QString message, qint64 duration_in_ms);

private:
    void setup_ui();
    QWidget *build_instances_tab();
    QWidget *build_player_tab();

    // --- Profiles ---

    void refresh_profiles();
    profile_list selected_profiles() const;
    void update_selected_label();

    // Missing label text and list colouring, from the last tick
    void update_missing_instances(const profile_list &missing);
    void apply_multi_instance_state();
    void update_player_tab_visibility();

    // --- Button handlers ---

    void handle_launch();
    void handle_launch_with_console();
    void handle_launch_game_link();
    void handle_launch_main_profile();
    void handle_run_missing();
    void handle_run_missing_with_link();
    void handle_exit_all();
    void handle_create_profile();
    void handle_fix_profiles();
    void handle_open_folder();
    void handle_multi_instance_toggled(bool checked);
    void handle_player_tab_toggled(bool checked);

    // Shows what a launch request did; nothing for a clean success
    void report_launch(const sl_mgmt::launch_report &report);

    // --- Profile context menu ---

    void show_profile_context_menu(const QPoint &pos);
    void create_desktop_entry(const QString &profile);
    void remove_profile(const QString &profile);

    // --- Create profile with a background copy ---

    void start_profile_copy(const QString &profile);

    // --- Roblox Player tab ---

    void refresh_private_server_buttons();
    void add_private_server();
    void edit_private_server(const QString &name);
    void remove_private_server(const QString &name);
    void run_parameter(const QString &parameter);
    void handle_quick_launch();
    void handle_edit_display_name();

    void save_settings();

    sl_mgmt::instance_controller &controller;
    sl_mgmt::settings_record &settings;
    std::string data_root;
    std::string settings_file;

    // UI elements
    QTabWidget *main_tabs = nullptr;
    QWidget *player_tab = nullptr;

    QListWidget *profile_list_widget = nullptr;
    QLabel *selected_label = nullptr;
    QPushButton *launch_btn = nullptr;
    QPushButton *console_btn = nullptr;
    QPushButton *game_link_btn = nullptr;
    QPushButton *main_profile_btn = nullptr;
    QPushButton *fix_btn = nullptr;
    QPushButton *refresh_btn = nullptr;
    QPushButton *create_btn = nullptr;
    QPushButton *exit_all_btn = nullptr;
    QPushButton *open_folder_btn = nullptr;
    QCheckBox *multi_instance_check = nullptr;

    QWidget *missing_bar = nullptr;
    QLabel *missing_label = nullptr;
    QPushButton *run_missing_btn = nullptr;
    QPushButton *run_missing_link_btn = nullptr;

    QLabel *display_name_label = nullptr;
    QHBoxLayout *private_servers_layout = nullptr;
    QAction *player_tab_act = nullptr;

    QTimer *tick_timer = nullptr;
    QFutureWatcher<QString> *copy_watcher = nullptr;

    QStatusBar *statusBar = nullptr;

private slots:
    void on_tick();
};

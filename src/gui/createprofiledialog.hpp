#pragma once

// createprofiledialog.hpp
//
// Asks for a new profile name and whether the main profile's data should
// be copied into it. The name is validated on Accept; creating the profile
// is left to the caller.
//
#include <QDialog>
#include <QString>

class QCheckBox;
class QLineEdit;
class QPushButton;

class CreateProfileDialog : public QDialog
{
    Q_OBJECT
public:
    explicit CreateProfileDialog(QWidget *parent = nullptr);
    ~CreateProfileDialog() override = default;

    QString profile_name() const;
    bool copy_main_profile() const;

private slots:
    // Refuses to close on an invalid name
    void accept() override;

    void on_text_changed(const QString &text);

private:
    QLineEdit *m_nameEdit = nullptr;
    QCheckBox *m_copyMain = nullptr;
    QPushButton *m_acceptBtn = nullptr;
    QPushButton *m_cancelBtn = nullptr;
};

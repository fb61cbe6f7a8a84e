// createprofiledialog.cpp

#include "soberlauncher/profiledata.hpp"
#include "createprofiledialog.hpp"

#include <QCheckBox>
#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>
#include <string>

CreateProfileDialog::CreateProfileDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Create Profile"));
    setModal(true);
    setMinimumWidth(380);

    auto *main_layout = new QVBoxLayout(this);

    auto *row = new QHBoxLayout();
    row->addWidget(new QLabel(tr("Profile name: "), this));
    m_nameEdit = new QLineEdit(this);
    row->addWidget(m_nameEdit, /*stretch=*/1);
    main_layout->addLayout(row);

    m_copyMain = new QCheckBox(tr("Copy the main profile"), this);
    m_copyMain->setChecked(false);
    main_layout->addWidget(m_copyMain);

    QLabel *note = new QLabel(
        tr("Copies the main profile's game data into the new profile, without its login. "
           "This may take a while."), this);
    QFont f = note->font();
    f.setItalic(true);
    f.setPointSizeF(f.pointSizeF() * 0.85);
    note->setFont(f);
    note->setWordWrap(true);
    main_layout->addWidget(note);

    auto *btn_row = new QHBoxLayout();
    btn_row->addStretch(1);

    m_acceptBtn = new QPushButton(tr("Create"), this);
    m_acceptBtn->setDefault(true);
    m_acceptBtn->setEnabled(false);
    connect(m_acceptBtn, &QPushButton::clicked, this, &CreateProfileDialog::accept);

    m_cancelBtn = new QPushButton(tr("Cancel"), this);
    connect(m_cancelBtn, &QPushButton::clicked, this, &CreateProfileDialog::reject);

    btn_row->addWidget(m_acceptBtn);
    btn_row->addWidget(m_cancelBtn);
    main_layout->addLayout(btn_row);

    connect(m_nameEdit, &QLineEdit::textChanged, this, &CreateProfileDialog::on_text_changed);
}

QString
CreateProfileDialog::profile_name() const
{
    return m_nameEdit->text().trimmed();
}

bool
CreateProfileDialog::copy_main_profile() const
{
    return m_copyMain->isChecked();
}

void
CreateProfileDialog::on_text_changed(const QString &text)
{
    m_acceptBtn->setEnabled(!text.trimmed().isEmpty());
}

void
CreateProfileDialog::accept()
{
    std::string error;
    if (!sl_mgmt::profiles::validate_name(profile_name().toStdString(), error)) {
        QMessageBox::warning(this, tr("Error"), QString::fromStdString(error));
        return;
    }

    QDialog::accept();
}

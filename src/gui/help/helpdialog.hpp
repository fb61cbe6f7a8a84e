#pragma once

#include <QDialog>
#include <QPushButton>
#include <QTextEdit>
#include <QVBoxLayout>

// Read-only Markdown viewer with a single Accept button
class help_dialog : public QDialog
{
    Q_OBJECT

public:
    help_dialog(QWidget *parent = nullptr, const QString &title = "", const QString &message = "");
private:
    QTextEdit *text_area;
    void setupTextArea(QTextEdit *text_area, const QString &message = "");

protected:
    bool eventFilter(QObject *obj, QEvent *event) override;
};

#pragma once

#include <QCoreApplication>
#include <QString>

// Markdown texts for the help dialogs
class helptexts
{
    Q_DECLARE_TR_FUNCTIONS(helptexts)

public:
    QString about();
    QString profiles_and_instances();
};

// include/soberlauncher/qt-debug.hpp
#pragma once
#ifdef SOBERLAUNCHER_DEBUG_LOGGING

#include "debug.hpp"
#include <QByteArray>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariant>

// Overloads for Qt types
inline void debug_print(std::ostream& os, const QString& value) {
    os << value.toStdString();
}

inline void debug_print(std::ostream& os, const QByteArray& value) {
    os << value.constData();
}

inline void debug_print(std::ostream& os, const QVariant& value) {
    os << value.toString().toStdString();
}

inline void debug_print(std::ostream& os, const QJsonValue& value) {
    os << "QJsonValue(type=" << static_cast<int>(value.type()) << ")";
}

inline void debug_print(std::ostream& os, const QStringList& list) {
    os << "QStringList[";
    for (int i = 0; i < list.size(); ++i) {
        if (i > 0) os << ", ";
        os << list[i].toStdString();
    }
    os << "]";
}

template<typename T>
inline void debug_print(std::ostream& os, const QList<T>& list) {
    os << "QList[";
    for (int i = 0; i < list.size(); ++i) {
        if (i > 0) os << ", ";
        debug_print(os, list[i]);
    }
    os << "]";
}

#endif // SOBERLAUNCHER_DEBUG_LOGGING

#include "soberlauncher/settings.hpp"
#include "soberlauncher/debug.hpp"
#include "soberlauncher/util.hpp"

#include <QByteArray>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QSaveFile>
#include <QString>

#include <algorithm>
#include <iostream>

namespace {

// {"name": ..., "parameter": ...} or ["name", "parameter"]
bool
parse_private_server(const QJsonValue &val, sl_mgmt::private_server &out)
{
    if (val.isObject()) {
        QJsonObject obj = val.toObject();
        if (!obj.value("name").isString() || !obj.value("parameter").isString())
            return false;
        out.name = obj.value("name").toString().toStdString();
        out.parameter = obj.value("parameter").toString().toStdString();
    } else if (val.isArray()) {
        QJsonArray pair = val.toArray();
        if (pair.size() != 2 || !pair.at(0).isString() || !pair.at(1).isString())
            return false;
        out.name = pair.at(0).toString().toStdString();
        out.parameter = pair.at(1).toString().toStdString();
    } else {
        return false;
    }

    return !sl_util::trim_string(out.name).empty();
}

std::vector<sl_mgmt::private_server>::iterator
find_server(sl_mgmt::settings_record &record, const std::string &name)
{
    return std::find_if(record.private_servers.begin(), record.private_servers.end(),
                        [&](const sl_mgmt::private_server &s) { return s.name == name; });
}

} // namespace

sl_mgmt::settings_record
sl_mgmt::settings::parse(const std::string &json_text, bool &ok, std::string &warning)
{
    settings_record record;
    ok = false;
    warning.clear();

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json_text), &err);

    if (err.error != QJsonParseError::NoError) {
        warning = "Malformed settings: " + err.errorString().toStdString();
        return record;
    }
    if (!doc.isObject()) {
        warning = "Malformed settings: top level is not an object";
        return record;
    }

    ok = true;
    QJsonObject obj = doc.object();

    // Wrongly typed fields keep their default
    if (obj.value("Version").isDouble())
        record.version = obj.value("Version").toInt(record.version);

    if (obj.value("Name").isString())
        record.display_name = obj.value("Name").toString().toStdString();

    if (obj.value("roblox_player_enabled").isBool())
        record.roblox_player_enabled = obj.value("roblox_player_enabled").toBool();

    if (obj.value("AllowMultiInstance").isBool())
        record.allow_multi_instance = obj.value("AllowMultiInstance").toBool();

    if (obj.value("PollIntervalMs").isDouble()) {
        int interval = obj.value("PollIntervalMs").toInt(record.poll_interval_ms);
        record.poll_interval_ms = std::clamp(interval,
                                             settings_record::min_poll_interval_ms,
                                             settings_record::max_poll_interval_ms);
    }

    if (obj.value("PrivateServers").isArray()) {
        for (const QJsonValue &val : obj.value("PrivateServers").toArray()) {
            private_server server;
            if (!parse_private_server(val, server)) {
                DEBUG_LOG("[settings] dropping malformed private server entry");
                continue;
            }
            // First one wins on duplicate names
            if (find_server(record, server.name) != record.private_servers.end())
                continue;
            record.private_servers.push_back(std::move(server));
        }
    }

    return record;
}

std::string
sl_mgmt::settings::serialize(const settings_record &record)
{
    QJsonArray servers;
    for (const auto &s : record.private_servers) {
        QJsonObject entry;
        entry.insert("name", QString::fromStdString(s.name));
        entry.insert("parameter", QString::fromStdString(s.parameter));
        servers.append(entry);
    }

    QJsonObject obj;
    obj.insert("Version", settings_record::current_version);
    obj.insert("Name", QString::fromStdString(record.display_name));
    obj.insert("PrivateServers", servers);
    obj.insert("roblox_player_enabled", record.roblox_player_enabled);
    obj.insert("AllowMultiInstance", record.allow_multi_instance);
    obj.insert("PollIntervalMs", record.poll_interval_ms);

    return QJsonDocument(obj).toJson(QJsonDocument::Indented).toStdString();
}

sl_mgmt::settings_record
sl_mgmt::settings::load(const std::string &path)
{
    QFile file(QString::fromStdString(path));

    if (!file.exists()) {
        settings_record defaults;
        std::string error;
        if (!save(defaults, path, error))
            std::cerr << "Warning: could not create " << path << ": " << error << std::endl;
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "Warning: could not read " << path << ": "
                  << file.errorString().toStdString() << ", using defaults" << std::endl;
        return settings_record{};
    }

    QByteArray contents = file.readAll();
    file.close();

    bool ok = false;
    std::string warning;
    settings_record record = parse(contents.toStdString(), ok, warning);
    if (!ok)
        std::cerr << "Warning: " << path << ": " << warning << ", using defaults" << std::endl;

    DEBUG_LOG("[settings] loaded ", path, ": multi-instance=", record.allow_multi_instance,
              " poll=", record.poll_interval_ms, "ms servers=", record.private_servers.size());
    return record;
}

bool
sl_mgmt::settings::save(const settings_record &record, const std::string &path, std::string &error)
{
    QSaveFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        error = file.errorString().toStdString();
        DEBUG_LOG("[settings] save failed: ", error);
        return false;
    }

    QByteArray data = QByteArray::fromStdString(serialize(record));
    if (file.write(data) != data.size() || !file.commit()) {
        error = file.errorString().toStdString();
        DEBUG_LOG("[settings] save failed: ", error);
        return false;
    }

    return true;
}

bool
sl_mgmt::settings::add_private_server(settings_record &record, const std::string &name, const std::string &parameter)
{
    if (sl_util::trim_string(name).empty() || find_server(record, name) != record.private_servers.end())
        return false;

    record.private_servers.push_back({name, parameter});
    return true;
}

bool
sl_mgmt::settings::edit_private_server(settings_record &record,
                                       const std::string &old_name,
                                       const std::string &new_name,
                                       const std::string &new_parameter)
{
    auto it = find_server(record, old_name);
    if (it == record.private_servers.end() || sl_util::trim_string(new_name).empty())
        return false;

    if (new_name != old_name && find_server(record, new_name) != record.private_servers.end())
        return false;

    it->name = new_name;
    it->parameter = new_parameter;
    return true;
}

bool
sl_mgmt::settings::remove_private_server(settings_record &record, const std::string &name)
{
    auto it = find_server(record, name);
    if (it == record.private_servers.end())
        return false;

    record.private_servers.erase(it);
    return true;
}

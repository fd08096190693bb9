#include "StatusReporter.hpp"
#include "../core/Logger.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkInterface>
#include <QSaveFile>
#include <cstdio>

namespace usb_audio {

namespace {

const char* const RULE = "=================================================================";

std::string formatRow(const std::string& card, const std::string& cardId,
                      const std::string& usb, const std::string& dev, const std::string& url) {
    char buffer[512];
    snprintf(buffer, sizeof(buffer), "%-4s | %-15s | %-30s | %-5s | %s",
             card.c_str(), cardId.c_str(), usb.c_str(), dev.c_str(), url.c_str());
    return buffer;
}

QString isoTime(const std::chrono::system_clock::time_point& tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms).toUTC().toString(Qt::ISODate);
}

std::chrono::system_clock::time_point fromIsoTime(const QString& text) {
    QDateTime parsed = QDateTime::fromString(text, Qt::ISODate);
    if (!parsed.isValid()) {
        return {};
    }
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(parsed.toMSecsSinceEpoch()));
}

StreamState stateFromString(const QString& text) {
    if (text == QLatin1String("starting")) return StreamState::Starting;
    if (text == QLatin1String("stopping")) return StreamState::Stopping;
    if (text == QLatin1String("dead")) return StreamState::Dead;
    return StreamState::Running;
}

}

std::string StatusReporter::formatTable(const std::vector<StreamProcess>& streams) {
    if (streams.empty()) {
        return "No audio streams were created. Check if you have audio capture devices connected.\n";
    }

    std::string table;
    table += std::string(RULE) + "\n";
    table += "                  ACTIVE AUDIO RTSP STREAMS                      \n";
    table += std::string(RULE) + "\n";
    table += formatRow("Card", "Card ID", "USB Device", "Dev", "RTSP URL") + "\n";
    table += "-----------------------------------------------------------------\n";
    for (const auto& stream : streams) {
        table += formatRow(std::to_string(stream.cardNumber), stream.capturedBy, stream.usbDescription,
                           std::to_string(stream.captureDeviceIndex), stream.endpointUrl) + "\n";
    }
    table += std::string(RULE) + "\n";
    return table;
}

std::string StatusReporter::remoteAccessHint(const std::string& streamHost,
                                             const std::optional<std::string>& hostAddress) {
    if (!hostAddress || hostAddress->empty()) {
        return {};
    }
    return "To access these streams from other devices on the network, replace\n'" +
           streamHost + "' with '" + *hostAddress + "' in the RTSP URLs\n";
}

bool StatusReporter::writeStatusFile(const std::string& filename, const StatusSnapshot& snapshot) {
    QJsonArray streams;
    for (const auto& stream : snapshot.streams) {
        QJsonObject json;
        json["card"] = stream.cardNumber;
        json["cardId"] = QString::fromStdString(stream.capturedBy);
        json["usbDevice"] = QString::fromStdString(stream.usbDescription);
        json["captureDevice"] = stream.captureDeviceIndex;
        json["url"] = QString::fromStdString(stream.endpointUrl);
        json["pid"] = static_cast<qint64>(stream.pid);
        json["startedAt"] = isoTime(stream.startedAt);
        json["state"] = QString::fromLatin1(toString(stream.state));
        streams.append(json);
    }

    QJsonObject root;
    root["generatedAt"] = QString::fromStdString(snapshot.generatedAt);
    root["streamHost"] = QString::fromStdString(snapshot.streamHost);
    root["streamPort"] = snapshot.streamPort;
    if (snapshot.hostAddress) {
        root["hostAddress"] = QString::fromStdString(*snapshot.hostAddress);
    }
    root["streams"] = streams;

    QString path = QString::fromStdString(filename);
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        LOG_ERROR("Cannot create directory for status file " + filename);
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR("Cannot write status file " + filename + ": " + file.errorString().toStdString());
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    if (!file.commit()) {
        LOG_ERROR("Cannot write status file " + filename + ": " + file.errorString().toStdString());
        return false;
    }
    return true;
}

std::optional<StatusSnapshot> StatusReporter::readStatusFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        LOG_WARNING("Status file " + filename + " is not valid JSON");
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    StatusSnapshot snapshot;
    snapshot.generatedAt = root["generatedAt"].toString().toStdString();
    snapshot.streamHost = root["streamHost"].toString().toStdString();
    snapshot.streamPort = root["streamPort"].toInt();
    if (root.contains("hostAddress")) {
        snapshot.hostAddress = root["hostAddress"].toString().toStdString();
    }

    const QJsonArray streams = root["streams"].toArray();
    for (const QJsonValue& value : streams) {
        QJsonObject json = value.toObject();
        StreamProcess stream;
        stream.cardNumber = json["card"].toInt();
        stream.capturedBy = json["cardId"].toString().toStdString();
        stream.usbDescription = json["usbDevice"].toString().toStdString();
        stream.captureDeviceIndex = json["captureDevice"].toInt();
        stream.endpointUrl = json["url"].toString().toStdString();
        stream.pid = static_cast<long long>(json["pid"].toDouble());
        stream.startedAt = fromIsoTime(json["startedAt"].toString());
        stream.state = stateFromString(json["state"].toString());
        snapshot.streams.push_back(stream);
    }
    return snapshot;
}

std::optional<std::string> StatusReporter::primaryIPv4Address() {
    for (const auto& iface : QNetworkInterface::allInterfaces()) {
        if (iface.flags().testFlag(QNetworkInterface::IsLoopBack)) continue;
        if (!iface.flags().testFlag(QNetworkInterface::IsUp)) continue;
        for (const auto& entry : iface.addressEntries()) {
            if (entry.ip().protocol() == QAbstractSocket::IPv4Protocol) {
                return entry.ip().toString().toStdString();
            }
        }
    }
    return std::nullopt;
}

}

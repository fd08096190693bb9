#include "OutputParsers.hpp"
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>

namespace usb_audio {
namespace parsers {

namespace {

const QString kPortFragment = QStringLiteral("\\d+-\\d+(?:\\.\\d+)*");

std::optional<std::string> nonEmpty(const QString& value) {
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value.toStdString();
}

}

std::vector<CardEntry> parseCardList(const QString& text) {
    static const QRegularExpression header(
        QStringLiteral("^\\s*(\\d+)\\s*\\[([^\\]]+)\\]\\s*:\\s*(.*)$"));

    std::vector<CardEntry> cards;
    bool expectLongName = false;

    const QStringList lines = text.split('\n');
    for (const QString& line : lines) {
        QRegularExpressionMatch match = header.match(line);
        if (match.hasMatch()) {
            CardEntry entry;
            entry.index = match.captured(1).toInt();
            entry.id = match.captured(2).trimmed().toStdString();
            QString description = match.captured(3).trimmed();
            entry.description = description.toStdString();
            int dash = description.indexOf(QStringLiteral(" - "));
            entry.driver = (dash >= 0 ? description.left(dash) : description).trimmed().toStdString();
            cards.push_back(entry);
            expectLongName = true;
            continue;
        }

        if (expectLongName && !line.trimmed().isEmpty() && !cards.empty()) {
            QString longName = line.trimmed();
            cards.back().longName = longName.toStdString();
            cards.back().usbPath = cardUsbPath(longName);
        }
        expectLongName = false;
    }

    return cards;
}

std::vector<CaptureEntry> parseCaptureList(const QString& text) {
    static const QRegularExpression entryPattern(
        QStringLiteral("^card\\s+(\\d+):\\s*(\\S+)\\s*\\[([^\\]]*)\\],\\s*device\\s+(\\d+):"));

    std::vector<CaptureEntry> entries;
    const QStringList lines = text.split('\n');
    for (const QString& line : lines) {
        QRegularExpressionMatch match = entryPattern.match(line.trimmed());
        if (!match.hasMatch()) {
            continue;
        }
        CaptureEntry entry;
        entry.cardIndex = match.captured(1).toInt();
        entry.cardId = match.captured(2).toStdString();
        entry.cardName = match.captured(3).toStdString();
        entry.deviceIndex = match.captured(4).toInt();
        entries.push_back(entry);
    }
    return entries;
}

std::map<std::string, std::string> parseUdevProperties(const QString& text) {
    std::map<std::string, std::string> properties;
    const QStringList lines = text.split('\n');
    for (const QString& line : lines) {
        int eq = line.indexOf('=');
        if (eq <= 0) {
            continue;
        }
        std::string key = line.left(eq).trimmed().toStdString();
        // first occurrence wins
        properties.emplace(key, line.mid(eq + 1).trimmed().toStdString());
    }
    return properties;
}

std::optional<std::string> parseUdevPath(const QString& text) {
    const QStringList lines = text.split('\n');
    for (const QString& line : lines) {
        QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            return trimmed.toStdString();
        }
    }
    return std::nullopt;
}

std::optional<std::string> trailingPortFragment(const QString& path) {
    static const QRegularExpression pattern(
        QStringLiteral("(?:^|/)(%1)/?$").arg(kPortFragment));
    QRegularExpressionMatch match = pattern.match(path.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1).toStdString();
}

std::optional<std::string> findPortFragment(const QString& text) {
    // Not part of a PCI address such as 0000:01:00.0-1.4
    static const QRegularExpression pattern(
        QStringLiteral("(?:^|[^\\d.:])(%1)(?![\\d.])").arg(kPortFragment));
    QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1).toStdString();
}

std::optional<std::string> hyphenatedLeafName(const QString& path) {
    QString trimmed = path.trimmed();
    while (trimmed.endsWith('/')) {
        trimmed.chop(1);
    }
    QString leaf = QFileInfo(trimmed).fileName();
    if (!leaf.contains('-')) {
        return std::nullopt;
    }
    return leaf.toStdString();
}

std::optional<std::string> cardUsbPath(const QString& longName) {
    static const QRegularExpression pattern(QStringLiteral("at (usb-[^ ,]+)"));
    QRegularExpressionMatch match = pattern.match(longName);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return nonEmpty(match.captured(1));
}

std::optional<std::string> cardPortChain(const QString& usbPath) {
    static const QRegularExpression pattern(
        QStringLiteral("^usb-.+-(\\d+(?:\\.\\d+)*)$"));
    QRegularExpressionMatch match = pattern.match(usbPath.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1).toStdString();
}

std::optional<std::pair<std::string, std::string>> parseUsbId(const QString& text) {
    static const QRegularExpression pattern(
        QStringLiteral("([0-9a-fA-F]{4}):([0-9a-fA-F]{4})"));
    QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return std::make_pair(match.captured(1).toLower().toStdString(),
                          match.captured(2).toLower().toStdString());
}

std::optional<int> parseDecimal(const QString& text) {
    bool ok = false;
    int value = text.trimmed().toInt(&ok, 10);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> captureDirectoryIndex(const QString& name) {
    static const QRegularExpression pattern(QStringLiteral("^pcm(\\d+)c$"));
    QRegularExpressionMatch match = pattern.match(name);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return match.captured(1).toInt();
}

}
}

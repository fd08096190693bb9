#include "RuleStore.hpp"
#include "Logger.hpp"
#include "OutputParsers.hpp"
#include "../security/Fingerprint.hpp"
#include <usb-audio/Constants.hpp>
#include <usb-audio/Errors.hpp>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>
#include <QTextStream>

namespace usb_audio {

namespace {

struct RuleAnnotations {
    std::string deviceName;
    std::string uniquenessTag;
    std::optional<std::chrono::system_clock::time_point> createdAt;

    void reset() { *this = RuleAnnotations{}; }
};

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    qint64 seconds = std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
    return QDateTime::fromSecsSinceEpoch(seconds).toUTC()
        .toString(Qt::ISODate).toStdString();
}

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const QString& text) {
    QDateTime parsed = QDateTime::fromString(text.trimmed(), Qt::ISODate);
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::time_point(
        std::chrono::seconds(parsed.toSecsSinceEpoch()));
}

std::string newUniquenessTag(const std::string& friendlyName) {
    return shortDigest(highResolutionStamp() + friendlyName, UNIQUENESS_TAG_LENGTH);
}

QString captured(const QRegularExpression& re, const QString& text) {
    QRegularExpressionMatch match = re.match(text);
    return match.hasMatch() ? match.captured(1) : QString();
}

}

class RuleStore::Private {
public:
    std::string rulesFile;
    std::vector<MappingRule> rules;

    void parseContents(const QString& contents) {
        static const QRegularExpression cardComment(
            QStringLiteral("^#\\s*USB Sound Card:\\s*(.*?)(?:\\s*\\((?:no reliable port info available|strict matching)\\))?$"));
        static const QRegularExpression tagComment(
            QStringLiteral("^#\\s*Uniqueness tag:\\s*(\\S+)"));
        static const QRegularExpression createdComment(
            QStringLiteral("^#\\s*Created:\\s*(\\S+)"));

        rules.clear();
        RuleAnnotations pending;

        const QStringList lines = contents.split('\n');
        for (const QString& rawLine : lines) {
            QString line = rawLine.trimmed();
            if (line.isEmpty()) {
                continue;
            }
            if (line.startsWith('#')) {
                QRegularExpressionMatch match = cardComment.match(line);
                if (match.hasMatch()) {
                    pending.reset();
                    pending.deviceName = match.captured(1).trimmed().toStdString();
                    continue;
                }
                QString tag = captured(tagComment, line);
                if (!tag.isEmpty()) {
                    pending.uniquenessTag = tag.toStdString();
                    continue;
                }
                QString created = captured(createdComment, line);
                if (!created.isEmpty()) {
                    pending.createdAt = parseIsoTimestamp(created);
                }
                continue;
            }

            auto rule = parseRuleLine(line.toStdString());
            if (!rule) {
                LOG_DEBUG("Ignoring foreign line in " + rulesFile + ": " + line.toStdString());
                continue;
            }
            rule->deviceName = pending.deviceName;
            rule->uniquenessTag = pending.uniquenessTag;
            if (pending.createdAt) {
                rule->createdAt = *pending.createdAt;
            }
            rules.push_back(*rule);
        }
    }

    std::string formatBlock(const MappingRule& rule, bool degraded) const {
        std::string block;
        block += "# USB Sound Card: " + rule.deviceName;
        if (degraded) {
            block += " (no reliable port info available)";
        }
        block += "\n";
        if (rule.portPattern) {
            block += "# Port pattern: " + *rule.portPattern;
            if (rule.matchMode == MatchMode::ExactPort) {
                block += " (strict matching)";
            }
            block += "\n";
        }
        block += "# Uniqueness tag: " + rule.uniquenessTag + "\n";
        block += "# Created: " + isoTimestamp(rule.createdAt) + "\n";
        block += formatRuleLine(rule) + "\n";
        return block;
    }

    void append(const std::string& block) const {
        QFileInfo info(QString::fromStdString(rulesFile));
        if (!QDir().mkpath(info.absolutePath())) {
            throw StoreWriteError("Cannot create directory " + info.absolutePath().toStdString());
        }

        QFile file(info.absoluteFilePath());
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            throw StoreWriteError("Failed to open " + rulesFile + ": " +
                                  file.errorString().toStdString());
        }

        QByteArray data = QByteArray::fromStdString(block);
        if (file.size() > 0) {
            data.prepend('\n');
        }
        if (file.write(data) != data.size() || !file.flush()) {
            throw StoreWriteError("Failed to write to " + rulesFile + ": " +
                                  file.errorString().toStdString());
        }
    }
};

RuleStore::RuleStore(const std::string& rulesFile)
    : d(std::make_unique<Private>()) {
    d->rulesFile = rulesFile;
}

RuleStore::~RuleStore() = default;

bool RuleStore::load() {
    QFile file(QString::fromStdString(d->rulesFile));
    if (!file.exists()) {
        LOG_INFO("No existing rules file " + d->rulesFile + ", a new one will be created");
        d->rules.clear();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_ERROR("Cannot read " + d->rulesFile + ": " + file.errorString().toStdString());
        return false;
    }

    d->parseContents(QString::fromUtf8(file.readAll()));
    LOG_DEBUG("Loaded " + std::to_string(d->rules.size()) + " rules from " + d->rulesFile);
    return true;
}

const std::vector<MappingRule>& RuleStore::rules() const {
    return d->rules;
}

std::string RuleStore::rulesFile() const {
    return d->rulesFile;
}

std::string RuleStore::rawContents() const {
    QFile file(QString::fromStdString(d->rulesFile));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll()).toStdString();
}

AddRuleResult RuleStore::addRule(const std::string& vendorId,
                                 const std::string& productId,
                                 const std::optional<std::string>& portPattern,
                                 MatchMode matchMode,
                                 const std::string& friendlyName,
                                 const std::string& deviceName) {
    if (!isValidUsbId(vendorId)) {
        throw ValidationError("Invalid vendor ID: " + vendorId + ". Must be a 4-digit hex value.");
    }
    if (!isValidUsbId(productId)) {
        throw ValidationError("Invalid product ID: " + productId + ". Must be a 4-digit hex value.");
    }
    if (!isValidFriendlyName(friendlyName)) {
        throw ValidationError("Invalid friendly name: " + friendlyName +
                              ". Use only lowercase letters, numbers, and hyphens.");
    }

    AddRuleResult result;
    MappingRule& rule = result.rule;
    rule.vendorId = vendorId;
    rule.productId = productId;
    rule.friendlyName = friendlyName;
    rule.deviceName = deviceName.empty() ? friendlyName : deviceName;
    rule.matchMode = matchMode;
    rule.createdAt = std::chrono::system_clock::now();
    rule.uniquenessTag = newUniquenessTag(friendlyName);

    if (matchMode != MatchMode::Basic) {
        std::optional<std::string> normalized;
        if (portPattern && !portPattern->empty()) {
            normalized = normalizePortPattern(*portPattern);
            if (!normalized) {
                LOG_WARNING("USB port path '" + *portPattern + "' appears invalid");
            }
        }

        if (!normalized) {
            LOG_WARNING("No reliable port pattern for " + friendlyName + ", requested " +
                        toString(matchMode) + " rule falls back to a basic rule "
                        "(vendor and product only; identical devices will share it)");
            rule.matchMode = MatchMode::Basic;
            result.degraded = true;
        } else {
            if (matchMode == MatchMode::ExactPort && !isKernelPortName(*normalized)) {
                LOG_WARNING("Port '" + *normalized + "' is not a kernel port name, "
                            "exact rule for " + friendlyName + " falls back to pattern matching");
                rule.matchMode = MatchMode::PortPattern;
                result.degraded = true;
            }
            rule.portPattern = normalized;
        }
    } else if (portPattern && !portPattern->empty()) {
        LOG_DEBUG("Basic rule requested, ignoring port " + *portPattern);
    }

    result.conflicts = findConflicts(vendorId, productId);
    for (const auto& existing : result.conflicts) {
        LOG_WARNING("Rule '" + existing.friendlyName + "' already matches " + vendorId + ":" +
                    productId + " (" + toString(existing.matchMode) +
                    "); the first matching rule wins, so it may shadow '" + friendlyName + "'");
    }

    d->append(d->formatBlock(rule, result.degraded && rule.matchMode == MatchMode::Basic));
    d->rules.push_back(rule);

    LOG_INFO("Added " + std::string(toString(rule.matchMode)) + " rule " + vendorId + ":" +
             productId + " -> " + friendlyName + " (tag " + rule.uniquenessTag + ")");
    return result;
}

std::vector<MappingRule> RuleStore::findConflicts(const std::string& vendorId,
                                                  const std::string& productId) const {
    std::vector<MappingRule> conflicts;
    for (const auto& rule : d->rules) {
        if (rule.vendorId == vendorId && rule.productId == productId) {
            conflicts.push_back(rule);
        }
    }
    return conflicts;
}

std::optional<MappingRule> RuleStore::match(const RuleMatchInput& input) const {
    for (const auto& rule : d->rules) {
        if (ruleMatches(rule, input)) {
            return rule;
        }
    }
    return std::nullopt;
}

bool RuleStore::isValidUsbId(const std::string& id) {
    static const QRegularExpression pattern(QStringLiteral("^[0-9a-f]{4}$"));
    return pattern.match(QString::fromStdString(id)).hasMatch();
}

bool RuleStore::isValidFriendlyName(const std::string& name) {
    static const QRegularExpression pattern(QStringLiteral("^[a-z0-9-]+$"));
    return pattern.match(QString::fromStdString(name)).hasMatch();
}

std::optional<std::string> RuleStore::normalizePortPattern(const std::string& port) {
    QString value = QString::fromStdString(port).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }

    if (auto fragment = parsers::findPortFragment(value)) {
        return fragment;
    }
    if (auto chain = parsers::cardPortChain(value)) {
        return "-" + *chain;
    }
    if (value.contains(QStringLiteral("usb")) &&
        (value.contains(':') || value.contains('-'))) {
        return value.toStdString();
    }
    return std::nullopt;
}

bool RuleStore::isKernelPortName(const std::string& pattern) {
    auto fragment = parsers::trailingPortFragment(QString::fromStdString(pattern));
    return fragment && *fragment == pattern;
}

bool RuleStore::ruleMatches(const MappingRule& rule, const RuleMatchInput& input) {
    if (rule.vendorId != input.vendorId || rule.productId != input.productId) {
        return false;
    }

    switch (rule.matchMode) {
        case MatchMode::Basic:
            return true;
        case MatchMode::PortPattern:
            return rule.portPattern &&
                   input.devicePath.find(*rule.portPattern) != std::string::npos;
        case MatchMode::ExactPort: {
            if (!rule.portPattern) {
                return false;
            }
            // KERNELS== compares against each ancestor's kernel name
            const QStringList segments =
                QString::fromStdString(input.devicePath).split('/', Qt::SkipEmptyParts);
            return segments.contains(QString::fromStdString(*rule.portPattern));
        }
    }
    return false;
}

std::string RuleStore::formatRuleLine(const MappingRule& rule) {
    std::string line = "SUBSYSTEM==\"sound\", ";
    if (rule.portPattern) {
        if (rule.matchMode == MatchMode::PortPattern) {
            line += "KERNELS==\"*" + *rule.portPattern + "*\", ";
        } else if (rule.matchMode == MatchMode::ExactPort) {
            line += "KERNELS==\"" + *rule.portPattern + "\", ";
        }
    }
    line += "ATTRS{idVendor}==\"" + rule.vendorId + "\", ";
    line += "ATTRS{idProduct}==\"" + rule.productId + "\", ";
    line += "ATTR{id}=\"" + rule.friendlyName + "\"";
    return line;
}

std::optional<MappingRule> RuleStore::parseRuleLine(const std::string& line) {
    static const QRegularExpression subsystem(QStringLiteral("SUBSYSTEM==\"sound\""));
    static const QRegularExpression kernels(QStringLiteral("KERNELS==\"([^\"]*)\""));
    static const QRegularExpression vendor(QStringLiteral("ATTRS\\{idVendor\\}==\"([^\"]*)\""));
    static const QRegularExpression product(QStringLiteral("ATTRS\\{idProduct\\}==\"([^\"]*)\""));
    static const QRegularExpression name(QStringLiteral("ATTR\\{id\\}=\"([^\"]*)\""));

    QString text = QString::fromStdString(line);
    if (!subsystem.match(text).hasMatch()) {
        return std::nullopt;
    }

    MappingRule rule;
    rule.vendorId = captured(vendor, text).toStdString();
    rule.productId = captured(product, text).toStdString();
    rule.friendlyName = captured(name, text).toStdString();
    if (rule.vendorId.empty() || rule.productId.empty() || rule.friendlyName.empty()) {
        return std::nullopt;
    }

    QString kernelMatch = captured(kernels, text);
    if (kernelMatch.isEmpty()) {
        rule.matchMode = MatchMode::Basic;
    } else if (kernelMatch.size() > 2 && kernelMatch.startsWith('*') && kernelMatch.endsWith('*')) {
        rule.matchMode = MatchMode::PortPattern;
        rule.portPattern = kernelMatch.mid(1, kernelMatch.size() - 2).toStdString();
    } else {
        rule.matchMode = MatchMode::ExactPort;
        rule.portPattern = kernelMatch.toStdString();
    }
    return rule;
}

}

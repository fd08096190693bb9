#pragma once
#include <usb-audio/Types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usb_audio {

struct AddRuleResult {
    MappingRule rule;
    bool degraded{false};                  // requested port matching fell back to Basic
    std::vector<MappingRule> conflicts;    // earlier rules for the same vendor/product
};

// What the runtime sees for one device when rules are evaluated.
struct RuleMatchInput {
    std::string vendorId;
    std::string productId;
    std::string devicePath;  // canonical sysfs path of the USB device
};

// Ordered udev rule list mapping USB sound cards to friendly names.
// Rules are appended, never rewritten; the device-naming layer applies the
// first matching rule, and match() evaluates them in the same order.
class RuleStore {
public:
    explicit RuleStore(const std::string& rulesFile);
    ~RuleStore();

    // A missing file is an empty store. Returns false if it exists but cannot be read.
    bool load();

    const std::vector<MappingRule>& rules() const;
    std::string rulesFile() const;
    std::string rawContents() const;

    // Throws ValidationError before anything is written, StoreWriteError if the append fails.
    AddRuleResult addRule(const std::string& vendorId,
                          const std::string& productId,
                          const std::optional<std::string>& portPattern,
                          MatchMode matchMode,
                          const std::string& friendlyName,
                          const std::string& deviceName = {});

    std::vector<MappingRule> findConflicts(const std::string& vendorId,
                                           const std::string& productId) const;

    std::optional<MappingRule> match(const RuleMatchInput& input) const;

    static bool isValidUsbId(const std::string& id);
    static bool isValidFriendlyName(const std::string& name);
    static std::optional<std::string> normalizePortPattern(const std::string& port);
    static bool isKernelPortName(const std::string& pattern);
    static bool ruleMatches(const MappingRule& rule, const RuleMatchInput& input);

    static std::string formatRuleLine(const MappingRule& rule);
    static std::optional<MappingRule> parseRuleLine(const std::string& line);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}

/**
 * @file JsonLoader.cpp
 * @brief JSON loader implementation with a small recursive-descent parser
 * @copyright Radarscope signal radar
 */

#include "radarscope/config/JsonLoader.hpp"
#include "radarscope/scanner/ScannerFactory.hpp"
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <variant>
#include <vector>

namespace radarscope {

namespace {

// Parsed JSON document node
struct JsonNode {
    using Object = std::map<std::string, JsonNode>;
    using Array = std::vector<JsonNode>;
    using Value = std::variant<std::monostate, bool, double, std::string, Array, Object>;

    Value value;

    JsonNode() : value(std::monostate{}) {}
    explicit JsonNode(Value v) : value(std::move(v)) {}

    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isNumber() const { return std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }

    const std::string& asString() const { return std::get<std::string>(value); }
    const Array& asArray() const { return std::get<Array>(value); }
    const Object& asObject() const { return std::get<Object>(value); }

    bool has(const std::string& key) const {
        return isObject() && asObject().count(key) > 0;
    }

    // Missing keys and non-objects yield a null node
    const JsonNode& operator[](const std::string& key) const {
        static const JsonNode null;
        if (!isObject()) return null;
        auto it = asObject().find(key);
        return (it != asObject().end()) ? it->second : null;
    }

    double numberOr(double def) const {
        return isNumber() ? std::get<double>(value) : def;
    }

    int intOr(int def) const {
        return isNumber() ? static_cast<int>(std::get<double>(value)) : def;
    }

    bool boolOr(bool def) const {
        return isBool() ? std::get<bool>(value) : def;
    }

    std::string stringOr(const std::string& def) const {
        return isString() ? asString() : def;
    }
};

class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    JsonNode parseDocument() {
        JsonNode root = parseValue();
        skipWhitespace();
        if (pos_ != text_.size()) {
            fail("trailing characters");
        }
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) + ": " + what);
    }

    void skipWhitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    char peek() const {
        return (pos_ < text_.size()) ? text_[pos_] : '\0';
    }

    void expect(char c) {
        skipWhitespace();
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool matchLiteral(const char* literal) {
        std::string word(literal);
        if (text_.compare(pos_, word.size(), word) == 0) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    JsonNode parseValue() {
        skipWhitespace();
        char c = peek();

        switch (c) {
            case '{': return parseObject();
            case '[': return parseArray();
            case '"': return JsonNode(parseString());
            case 't':
                if (matchLiteral("true")) return JsonNode(true);
                break;
            case 'f':
                if (matchLiteral("false")) return JsonNode(false);
                break;
            case 'n':
                if (matchLiteral("null")) return JsonNode();
                break;
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                    return parseNumber();
                }
                break;
        }

        fail("unexpected character");
    }

    std::string parseString() {
        expect('"');
        std::string out;

        while (true) {
            if (pos_ >= text_.size()) {
                fail("unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                out += c;
                continue;
            }

            if (pos_ >= text_.size()) {
                fail("unterminated escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                default: out += esc; break;   // \" \\ \/
            }
        }

        return out;
    }

    JsonNode parseNumber() {
        size_t start = pos_;
        auto digits = [this]() {
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        };

        if (peek() == '-') ++pos_;
        digits();
        if (peek() == '.') {
            ++pos_;
            digits();
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            digits();
        }

        try {
            return JsonNode(std::stod(text_.substr(start, pos_ - start)));
        } catch (const std::exception&) {
            fail("malformed number");
        }
    }

    JsonNode parseArray() {
        expect('[');
        JsonNode::Array items;

        skipWhitespace();
        if (peek() == ']') {
            ++pos_;
            return JsonNode(std::move(items));
        }

        while (true) {
            items.push_back(parseValue());
            skipWhitespace();
            if (peek() == ']') {
                ++pos_;
                break;
            }
            expect(',');
        }

        return JsonNode(std::move(items));
    }

    JsonNode parseObject() {
        expect('{');
        JsonNode::Object members;

        skipWhitespace();
        if (peek() == '}') {
            ++pos_;
            return JsonNode(std::move(members));
        }

        while (true) {
            skipWhitespace();
            std::string key = parseString();
            expect(':');
            members[key] = parseValue();

            skipWhitespace();
            if (peek() == '}') {
                ++pos_;
                break;
            }
            expect(',');
        }

        return JsonNode(std::move(members));
    }
};

void readSweep(const JsonNode& node, RadarConfig::SweepParams& sweep) {
    sweep.sweepSpeed = node["speed"].numberOr(sweep.sweepSpeed);
    sweep.beamWidth = node["beamWidth"].numberOr(sweep.beamWidth);
    sweep.minSweepSpeed = node["minSpeed"].numberOr(sweep.minSweepSpeed);
    sweep.maxSweepSpeed = node["maxSpeed"].numberOr(sweep.maxSweepSpeed);
    sweep.refreshRate = node["refreshRate"].numberOr(sweep.refreshRate);
}

void readSignals(const JsonNode& node, RadarConfig::SignalParams& signals) {
    signals.signalLifetime = node["lifetime"].numberOr(signals.signalLifetime);
    signals.maxPhase = node["maxPhase"].intOr(signals.maxPhase);
    signals.minDistance = node["minDistance"].numberOr(signals.minDistance);
    signals.decayTime = node["decayTime"].numberOr(signals.decayTime);
    signals.visibilityThreshold = node["visibilityThreshold"].numberOr(signals.visibilityThreshold);
    signals.strengthJitterProbability =
        node["strengthJitterProbability"].numberOr(signals.strengthJitterProbability);
}

void readHistory(const JsonNode& node, RadarConfig::HistoryParams& history) {
    history.enableHistory = node["enabled"].boolOr(history.enableHistory);
    history.historyUpdateRate = node["updateRate"].numberOr(history.historyUpdateRate);
    history.maxHistory = node["maxHistory"].intOr(history.maxHistory);
}

void readManagement(const JsonNode& node, RadarConfig::ManagementParams& mgmt) {
    mgmt.managementInterval = node["interval"].numberOr(mgmt.managementInterval);
    mgmt.spawnProbability = node["spawnProbability"].numberOr(mgmt.spawnProbability);
    mgmt.enableFiltering = node["enableFiltering"].boolOr(mgmt.enableFiltering);
    mgmt.seedWithSimulated = node["seedWithSimulated"].boolOr(mgmt.seedWithSimulated);
    if (node["rngSeed"].isNumber()) {
        mgmt.rngSeed = static_cast<uint32_t>(node["rngSeed"].numberOr(0.0));
    }
}

void readScan(const JsonNode& node, ScanConfig& scan) {
    scan.scanInterval = node["interval"].numberOr(scan.scanInterval);
    scan.maxSignals = node["maxSignals"].intOr(scan.maxSignals);
    scan.maxScanRange = node["maxRange"].numberOr(scan.maxScanRange);
    scan.useRealData = node["useRealData"].boolOr(scan.useRealData);
    scan.enableConsent = node["enableConsent"].boolOr(scan.enableConsent);
    scan.useSimulatedFallback = node["useSimulatedFallback"].boolOr(scan.useSimulatedFallback);
    scan.scanTimeout = node["scanTimeout"].numberOr(scan.scanTimeout);
    scan.collectTimeout = node["collectTimeout"].numberOr(scan.collectTimeout);

    if (node["scanners"].isArray()) {
        scan.scanners.clear();
        for (const auto& entry : node["scanners"].asArray()) {
            if (!entry.isString()) {
                continue;
            }
            if (!ScannerFactory::isValidScanner(entry.asString())) {
                throw std::invalid_argument("Unknown scanner: " + entry.asString());
            }
            scan.scanners.push_back(entry.asString());
        }
    }
}

RadarConfig convertToConfig(const JsonNode& root) {
    if (!root.isObject()) {
        throw std::runtime_error("JSON root must be an object");
    }

    RadarConfig config;

    if (root["sweep"].isObject()) readSweep(root["sweep"], config.sweep);
    if (root["signals"].isObject()) readSignals(root["signals"], config.signals);
    if (root["history"].isObject()) readHistory(root["history"], config.history);
    if (root["management"].isObject()) readManagement(root["management"], config.management);
    if (root["scan"].isObject()) readScan(root["scan"], config.scan);

    config.logLevel = root["logLevel"].stringOr(config.logLevel);

    if (!config.isValid()) {
        throw std::runtime_error("Configuration values out of range");
    }

    return config;
}

}  // anonymous namespace

RadarConfig JsonLoader::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return loadFromString(buffer.str());
}

RadarConfig JsonLoader::loadFromString(const std::string& jsonString) {
    JsonParser parser(jsonString);
    return convertToConfig(parser.parseDocument());
}

} // namespace radarscope

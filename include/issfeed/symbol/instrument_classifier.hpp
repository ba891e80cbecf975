#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace issfeed {
namespace symbol {

// Decides whether a ticker belongs to the ISS source
class InstrumentClassifier {
public:
    static const std::vector<std::string> SOURCE_SUFFIXES;
    static const std::unordered_set<std::string> DEFAULT_TICKERS;

    InstrumentClassifier();
    explicit InstrumentClassifier(const std::vector<std::string>& extra_tickers);

    // Allow-listed after canonicalization, or carrying a source suffix
    bool is_eligible(const std::string& symbol) const;

    // Upper-cased with any trailing source suffix removed
    static std::string canonicalize(const std::string& symbol);

    static bool has_source_suffix(const std::string& symbol);

    const std::unordered_set<std::string>& tickers() const { return tickers_; }

private:
    std::unordered_set<std::string> tickers_;
};

} // namespace symbol
} // namespace issfeed

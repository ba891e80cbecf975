#include "issfeed/symbol/instrument_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace issfeed {
namespace symbol {

namespace {

std::string to_upper_ascii(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// Longest first so ".MOEX" is never read as ".ME"-something
const std::vector<std::string> InstrumentClassifier::SOURCE_SUFFIXES = {".MOEX", ".ME"};

const std::unordered_set<std::string> InstrumentClassifier::DEFAULT_TICKERS = {
    "OZON", "SBER", "GAZP", "LKOH", "YNDX", "ROSN",
    "NVTK", "GMKN", "TATN", "MGNT", "AFLT", "MTSS",
    "VKCO", "POLY", "SNGS", "PLZL", "FEES", "ALRS",
    "MOEX", "RUAL", "CHMF", "NLMK", "PHOR", "PIKK",
    "VTBR", "IRAO", "SBERP", "TRNFP", "HYDR", "RTKM",
    "CBOM", "TCSG", "SMLT", "SGZH", "BELU", "FIXP",
    "OKEY", "FIVE", "GLTR", "BSPB", "DSKY", "LSRG",
    "MVID", "UPRO", "FLOT", "KMAZ", "SOFL", "ASTR",
    "MDMG", "HHRU", "WUSH", "POSI", "MSNG", "AQUA"
};

InstrumentClassifier::InstrumentClassifier()
    : tickers_(DEFAULT_TICKERS) {
}

InstrumentClassifier::InstrumentClassifier(const std::vector<std::string>& extra_tickers)
    : tickers_(DEFAULT_TICKERS) {
    for (const auto& ticker : extra_tickers) {
        auto clean = canonicalize(ticker);
        if (!clean.empty()) {
            tickers_.insert(clean);
        }
    }
}

bool InstrumentClassifier::is_eligible(const std::string& symbol) const {
    if (symbol.empty()) {
        return false;
    }
    return tickers_.count(canonicalize(symbol)) > 0 || has_source_suffix(symbol);
}

std::string InstrumentClassifier::canonicalize(const std::string& symbol) {
    std::string upper = to_upper_ascii(symbol);
    for (const auto& suffix : SOURCE_SUFFIXES) {
        if (ends_with(upper, suffix)) {
            upper.erase(upper.size() - suffix.size());
            break;
        }
    }
    return upper;
}

// Suffix tags are matched on the raw symbol, case-sensitively
bool InstrumentClassifier::has_source_suffix(const std::string& symbol) {
    for (const auto& suffix : SOURCE_SUFFIXES) {
        // a bare suffix is not a ticker
        if (symbol.size() > suffix.size() && ends_with(symbol, suffix)) {
            return true;
        }
    }
    return false;
}

} // namespace symbol
} // namespace issfeed

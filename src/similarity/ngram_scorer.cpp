#include <similarity/similarity_scorer.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Databrain {

NGramSimilarityScorer::NGramSimilarityScorer(const NGramScorerConfig& config) : config_(config) {
    if (config_.n == 0) config_.n = 3;
}

std::vector<std::string> NGramSimilarityScorer::words(std::string_view text) {
    std::vector<std::string> out;
    std::string current;

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        // Bytes >= 0x80 are kept so UTF-8 words stay intact
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            out.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) out.push_back(std::move(current));

    return out;
}

std::unordered_set<std::string> NGramSimilarityScorer::grams(std::string_view text) const {
    std::unordered_set<std::string> out;
    for (const auto& word : words(text)) {
        if (word.size() < config_.n) continue;
        for (size_t i = 0; i + config_.n <= word.size(); ++i) {
            out.insert(word.substr(i, config_.n));
        }
    }
    return out;
}

std::string NGramSimilarityScorer::signature(const std::string& label, const std::string& description) const {
    auto set = grams(label + " " + description);
    std::vector<std::string> sorted(set.begin(), set.end());
    std::sort(sorted.begin(), sorted.end());

    std::string sig;
    for (const auto& g : sorted) {
        if (!sig.empty()) sig.push_back(' ');
        sig += g;
    }
    return sig;
}

std::unordered_set<std::string> NGramSimilarityScorer::node_grams(const Node& node) const {
    if (node.similarity_signature.empty()) {
        return grams(node.label + " " + node.description);
    }

    std::unordered_set<std::string> out;
    std::istringstream in(node.similarity_signature);
    std::string g;
    while (in >> g) out.insert(g);
    return out;
}

double NGramSimilarityScorer::score(const std::string& query, const Node& node) const {
    auto query_words = words(query);
    if (query_words.empty()) return 0.0;

    auto target = node_grams(node);
    auto label_words = words(node.label);
    std::vector<std::string> all_words = label_words;
    for (auto& w : words(node.description)) all_words.push_back(std::move(w));

    size_t total = 0;
    size_t hits = 0;

    std::unordered_set<std::string> seen;
    for (const auto& word : query_words) {
        if (word.size() < config_.n) {
            if (!seen.insert(word).second) continue;
            ++total;
            bool prefix = std::any_of(all_words.begin(), all_words.end(), [&](const std::string& w) {
                return w.compare(0, word.size(), word) == 0;
            });
            if (prefix) ++hits;
            continue;
        }
        for (size_t i = 0; i + config_.n <= word.size(); ++i) {
            std::string g = word.substr(i, config_.n);
            if (!seen.insert(g).second) continue;
            ++total;
            if (target.count(g)) ++hits;
        }
    }

    if (total == 0 || hits == 0) return 0.0;

    double s = static_cast<double>(hits) / static_cast<double>(total);

    bool all_in_label = std::all_of(query_words.begin(), query_words.end(), [&](const std::string& q) {
        return std::find(label_words.begin(), label_words.end(), q) != label_words.end();
    });
    if (all_in_label) s += config_.label_word_bonus;

    return std::min(1.0, s);
}

} // namespace Databrain

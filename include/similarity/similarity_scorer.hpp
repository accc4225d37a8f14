/**
 * @file similarity_scorer.hpp
 * @brief Pluggable query-to-node similarity
 */

#pragma once

#include <core/types.hpp>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace Databrain {

/**
 * @brief Scores how well a free-text query matches a node.
 *
 * Implementations own the format of Node::similarity_signature: the engine
 * calls signature() when a node is created or merged and stores the result
 * opaquely. A vector-embedding scorer can replace the lexical default
 * without touching the store or the engine.
 */
class SimilarityScorer {
public:
    virtual ~SimilarityScorer() = default;

    /**
     * @brief Compute the stored signature for node content.
     */
    virtual std::string signature(const std::string& label, const std::string& description) const = 0;

    /**
     * @brief Score in [0, 1]; 0 means no evidence of a match.
     */
    virtual double score(const std::string& query, const Node& node) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Configuration for the lexical scorer
 */
struct NGramScorerConfig {
    size_t n = 3;                     // character n-gram size
    double label_word_bonus = 0.25;   // every query word is a word of the label
};

/**
 * @brief Lexical character n-gram overlap against label + description.
 *
 * Score = matched / total over the query's n-grams, plus a bonus when every
 * query word is a word of the label, clamped to [0, 1]. Query words too
 * short to form an n-gram count as matched when some node word starts
 * with them.
 * Signature format: space-separated sorted unique n-grams.
 */
class NGramSimilarityScorer : public SimilarityScorer {
public:
    explicit NGramSimilarityScorer(const NGramScorerConfig& config = NGramScorerConfig());

    std::string signature(const std::string& label, const std::string& description) const override;
    double score(const std::string& query, const Node& node) const override;
    std::string name() const override { return "ngram"; }

    /**
     * @brief Lowercase alphanumeric words of a text
     */
    static std::vector<std::string> words(std::string_view text);

    /**
     * @brief Unique character n-grams taken within each word
     */
    std::unordered_set<std::string> grams(std::string_view text) const;

private:
    std::unordered_set<std::string> node_grams(const Node& node) const;

    NGramScorerConfig config_;
};

} // namespace Databrain

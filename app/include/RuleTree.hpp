#ifndef RULE_TREE_HPP
#define RULE_TREE_HPP

#include <QJsonArray>
#include <QJsonObject>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

struct RuleMatcher {
    enum class Kind {
        Extension,   // ".pdf"
        Glob,        // "invoice_*.pdf"
        MimeHint     // "mime:image/*"
    };

    Kind kind = Kind::Extension;
    QString pattern;
    QRegularExpression regex;

    // Normalizes a user token into a matcher. Returns false for blank tokens.
    static bool parse(const QString& token, RuleMatcher& out);
};

struct RuleNode {
    std::vector<RuleMatcher> matchers;
    QString category;
    QString subcategory;                 // "" for top-level nodes, "A/B" for nested ones
    std::vector<RuleNode> children;
};

struct RuleMatch {
    bool matched = false;
    QString category;
    QString subcategory;
};

// Immutable once built. Share as std::shared_ptr<const RuleTree> and swap whole trees on reload.
class RuleTree {
public:
    RuleTree() = default;
    explicit RuleTree(std::vector<RuleNode> roots);

    // Ordered form: [{"name": "Documents", "matchers": [...], "children": [...]}, ...]
    static std::shared_ptr<const RuleTree> from_json_array(const QJsonArray& rules, QStringList* warnings = nullptr);
    // Keyed form: {"Images": [".jpg"], "Documents": {"PDF": [".pdf"], "__extensions__": [".txt"]}}
    static std::shared_ptr<const RuleTree> from_json_object(const QJsonObject& rules, QStringList* warnings = nullptr);
    static std::shared_ptr<const RuleTree> default_tree();

    RuleMatch match(const QString& file_path) const;

    const std::vector<RuleNode>& roots() const { return roots_; }
    QStringList top_level_categories() const;
    bool is_top_level_category(const QString& name) const;
    bool uses_mime_hints() const { return uses_mime_hints_; }
    bool empty() const { return roots_.empty(); }

private:
    struct MatchContext;

    bool node_matches(const RuleNode& node, MatchContext& ctx) const;
    bool own_matchers_match(const RuleNode& node, MatchContext& ctx) const;
    static bool parse_node(const QJsonObject& obj, const QString& category, const QString& parent_sub,
                           RuleNode& out, QStringList* warnings);
    static void add_matchers(const QJsonArray& tokens, RuleNode& node, QStringList* warnings);

    std::vector<RuleNode> roots_;
    bool uses_mime_hints_ = false;
};

#endif // RULE_TREE_HPP

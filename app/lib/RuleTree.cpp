#include "RuleTree.hpp"
#include <QFileInfo>
#include <QMimeDatabase>
#include <QMimeType>
#include <functional>

namespace {

const QString kExtensionsKey = QStringLiteral("__extensions__");
const QString kMimePrefix = QStringLiteral("mime:");

bool looks_like_glob(const QString& token) {
    return token.contains('*') || token.contains('?') || token.contains('[');
}

QRegularExpression wildcard_regex(const QString& pattern) {
    return QRegularExpression(QRegularExpression::wildcardToRegularExpression(pattern),
                              QRegularExpression::CaseInsensitiveOption);
}

RuleNode make_node(const QString& category, const QString& subcategory, const QStringList& tokens) {
    RuleNode node;
    node.category = category;
    node.subcategory = subcategory;
    for (const QString& token : tokens) {
        RuleMatcher matcher;
        if (RuleMatcher::parse(token, matcher)) {
            node.matchers.push_back(matcher);
        }
    }
    return node;
}

} // namespace

struct RuleTree::MatchContext {
    QString path;
    QString file_name;
    bool mime_resolved = false;
    QMimeType mime;

    const QMimeType& mime_type() {
        if (!mime_resolved) {
            QMimeDatabase db;
            // Extension first; only sniff content when the name carries no hint.
            mime = db.mimeTypeForFile(path, QMimeDatabase::MatchExtension);
            if (mime.isDefault()) {
                mime = db.mimeTypeForFile(path, QMimeDatabase::MatchContent);
            }
            mime_resolved = true;
        }
        return mime;
    }
};

bool RuleMatcher::parse(const QString& token, RuleMatcher& out) {
    QString text = token.trimmed();
    if (text.isEmpty()) {
        return false;
    }

    if (text.startsWith(kMimePrefix, Qt::CaseInsensitive)) {
        text = text.mid(kMimePrefix.size()).trimmed().toLower();
        if (text.isEmpty()) {
            return false;
        }
        out.kind = Kind::MimeHint;
        out.pattern = text;
        out.regex = wildcard_regex(text);
        return true;
    }

    if (looks_like_glob(text)) {
        out.kind = Kind::Glob;
        out.pattern = text;
        out.regex = wildcard_regex(text);
        return out.regex.isValid();
    }

    text.remove(' ');
    text = text.toLower();
    if (!text.startsWith('.')) {
        text.prepend('.');
    }
    if (text == ".") {
        return false;
    }
    out.kind = Kind::Extension;
    out.pattern = text;
    out.regex = QRegularExpression();
    return true;
}

RuleTree::RuleTree(std::vector<RuleNode> roots)
    : roots_(std::move(roots)) {
    std::vector<const RuleNode*> stack;
    for (const RuleNode& node : roots_) {
        stack.push_back(&node);
    }
    while (!stack.empty()) {
        const RuleNode* node = stack.back();
        stack.pop_back();
        for (const RuleMatcher& m : node->matchers) {
            if (m.kind == RuleMatcher::Kind::MimeHint) {
                uses_mime_hints_ = true;
            }
        }
        for (const RuleNode& child : node->children) {
            stack.push_back(&child);
        }
    }
}

RuleMatch RuleTree::match(const QString& file_path) const {
    RuleMatch result;

    MatchContext ctx;
    ctx.path = file_path;
    ctx.file_name = QFileInfo(file_path).fileName();

    const std::vector<RuleNode>* level = &roots_;
    const RuleNode* chosen = nullptr;

    // First matching sibling wins at every level; descend while a child still matches.
    while (level) {
        const RuleNode* next = nullptr;
        for (const RuleNode& node : *level) {
            if (node_matches(node, ctx)) {
                next = &node;
                break;
            }
        }
        if (!next) {
            break;
        }
        chosen = next;
        level = next->children.empty() ? nullptr : &next->children;
    }

    if (chosen) {
        result.matched = true;
        result.category = chosen->category;
        result.subcategory = chosen->subcategory;
    }
    return result;
}

bool RuleTree::node_matches(const RuleNode& node, MatchContext& ctx) const {
    if (own_matchers_match(node, ctx)) {
        return true;
    }
    for (const RuleNode& child : node.children) {
        if (node_matches(child, ctx)) {
            return true;
        }
    }
    return false;
}

bool RuleTree::own_matchers_match(const RuleNode& node, MatchContext& ctx) const {
    for (const RuleMatcher& m : node.matchers) {
        switch (m.kind) {
            case RuleMatcher::Kind::Extension:
                if (ctx.file_name.size() > m.pattern.size()
                    && ctx.file_name.endsWith(m.pattern, Qt::CaseInsensitive)) {
                    return true;
                }
                break;
            case RuleMatcher::Kind::Glob:
                if (m.regex.match(ctx.file_name).hasMatch()) {
                    return true;
                }
                break;
            case RuleMatcher::Kind::MimeHint: {
                const QMimeType& mime = ctx.mime_type();
                if (!mime.isValid()) {
                    break;
                }
                if (m.regex.match(mime.name()).hasMatch()) {
                    return true;
                }
                if (!m.pattern.contains('*') && mime.inherits(m.pattern)) {
                    return true;
                }
                break;
            }
        }
    }
    return false;
}

QStringList RuleTree::top_level_categories() const {
    QStringList names;
    for (const RuleNode& node : roots_) {
        if (!names.contains(node.category)) {
            names.append(node.category);
        }
    }
    return names;
}

bool RuleTree::is_top_level_category(const QString& name) const {
    for (const RuleNode& node : roots_) {
        if (node.category.compare(name, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

void RuleTree::add_matchers(const QJsonArray& tokens, RuleNode& node, QStringList* warnings) {
    for (const QJsonValue& value : tokens) {
        if (!value.isString()) {
            if (warnings) {
                warnings->append(QString("Non-string matcher ignored in '%1'").arg(node.category));
            }
            continue;
        }
        RuleMatcher matcher;
        if (RuleMatcher::parse(value.toString(), matcher)) {
            node.matchers.push_back(matcher);
        } else if (warnings) {
            warnings->append(QString("Invalid matcher '%1' ignored in '%2'")
                                 .arg(value.toString(), node.category));
        }
    }
}

bool RuleTree::parse_node(const QJsonObject& obj, const QString& category, const QString& parent_sub,
                          RuleNode& out, QStringList* warnings) {
    const QString name = obj.value("name").toString().trimmed();
    if (name.isEmpty()) {
        if (warnings) {
            warnings->append("Rule without a 'name' ignored");
        }
        return false;
    }

    out.category = category.isEmpty() ? name : category;
    if (!category.isEmpty()) {
        out.subcategory = parent_sub.isEmpty() ? name : parent_sub + "/" + name;
    }
    add_matchers(obj.value("matchers").toArray(), out, warnings);

    for (const QJsonValue& child_value : obj.value("children").toArray()) {
        if (!child_value.isObject()) {
            continue;
        }
        RuleNode child;
        if (parse_node(child_value.toObject(), out.category, out.subcategory, child, warnings)) {
            out.children.push_back(std::move(child));
        }
    }
    return true;
}

std::shared_ptr<const RuleTree> RuleTree::from_json_array(const QJsonArray& rules, QStringList* warnings) {
    std::vector<RuleNode> roots;
    for (const QJsonValue& value : rules) {
        if (!value.isObject()) {
            if (warnings) {
                warnings->append("Rule entry is not an object");
            }
            continue;
        }
        RuleNode node;
        if (parse_node(value.toObject(), QString(), QString(), node, warnings)) {
            roots.push_back(std::move(node));
        }
    }
    return std::make_shared<const RuleTree>(std::move(roots));
}

std::shared_ptr<const RuleTree> RuleTree::from_json_object(const QJsonObject& rules, QStringList* warnings) {
    std::vector<RuleNode> roots;

    // Recursive helper for "sub -> [..]" or "sub -> {..}" values.
    std::function<void(RuleNode&, const QJsonObject&)> fill_children;
    fill_children = [&](RuleNode& parent, const QJsonObject& obj) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (it.key() == kExtensionsKey) {
                add_matchers(it.value().toArray(), parent, warnings);
                continue;
            }
            RuleNode child;
            child.category = parent.category;
            child.subcategory = parent.subcategory.isEmpty() ? it.key() : parent.subcategory + "/" + it.key();
            if (it.value().isArray()) {
                add_matchers(it.value().toArray(), child, warnings);
            } else if (it.value().isObject()) {
                fill_children(child, it.value().toObject());
            } else {
                if (warnings) {
                    warnings->append(QString("Sub-rule '%1' must be a list or an object").arg(it.key()));
                }
                continue;
            }
            parent.children.push_back(std::move(child));
        }
    };

    for (auto it = rules.begin(); it != rules.end(); ++it) {
        RuleNode node;
        node.category = it.key();
        if (it.value().isArray()) {
            add_matchers(it.value().toArray(), node, warnings);
        } else if (it.value().isObject()) {
            fill_children(node, it.value().toObject());
        } else {
            if (warnings) {
                warnings->append(QString("Rule '%1' must be a list or an object").arg(it.key()));
            }
            continue;
        }
        roots.push_back(std::move(node));
    }
    return std::make_shared<const RuleTree>(std::move(roots));
}

std::shared_ptr<const RuleTree> RuleTree::default_tree() {
    std::vector<RuleNode> roots;

    roots.push_back(make_node("Images", "", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".heic", ".tiff"}));
    roots.push_back(make_node("Video", "", {".mp4", ".mkv", ".mov", ".avi", ".wmv", ".webm", ".m4v"}));
    roots.push_back(make_node("Audio", "", {".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a"}));

    RuleNode documents = make_node("Documents", "", {});
    documents.children.push_back(make_node("Documents", "PDF", {".pdf"}));
    documents.children.push_back(make_node("Documents", "Word", {".doc", ".docx", ".odt", ".rtf"}));
    documents.children.push_back(make_node("Documents", "Spreadsheets", {".xls", ".xlsx", ".ods", ".csv"}));
    documents.children.push_back(make_node("Documents", "Presentations", {".ppt", ".pptx", ".odp"}));
    documents.children.push_back(make_node("Documents", "Text", {".txt", ".md"}));
    roots.push_back(std::move(documents));

    roots.push_back(make_node("Archives", "", {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz"}));
    roots.push_back(make_node("Installers", "", {".exe", ".msi", ".dmg", ".pkg", ".deb", ".rpm", ".appimage"}));
    roots.push_back(make_node("Code", "", {".py", ".js", ".ts", ".cpp", ".hpp", ".c", ".h", ".java", ".json", ".html", ".css"}));

    return std::make_shared<const RuleTree>(std::move(roots));
}

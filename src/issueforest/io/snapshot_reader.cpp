/**
 * @file snapshot_reader.cpp
 */
#include "issueforest/io/snapshot_reader.hpp"
#include "issueforest/common/forest_exceptions.hpp"
#include "issueforest/runtime/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace issueforest
{

namespace
{

[[noreturn]] void parse_error(const std::string& where, const std::string& message)
{
    throw ForestError(ForestErrorCode::ParseFailed, where + ": " + message);
}

std::string scalar_or_empty(const YAML::Node& node)
{
    if (!node || node.IsNull() || !node.IsScalar())
    {
        return {};
    }
    return node.Scalar();
}

std::string first_scalar(const YAML::Node& obj, const char* key, const char* alternate)
{
    std::string value = scalar_or_empty(obj[key]);
    if (value.empty())
    {
        value = scalar_or_empty(obj[alternate]);
    }
    return value;
}

template <typename T>
T scalar_as(const YAML::Node& node, const T& fallback, const std::string& where, const char* key)
{
    if (!node || node.IsNull())
    {
        return fallback;
    }
    try
    {
        return node.as<T>();
    }
    catch (const YAML::Exception&)
    {
        parse_error(where, std::string("field '") + key + "' has an invalid value");
    }
}

IssueRecord parse_issue(const YAML::Node& obj, const std::string& where)
{
    if (!obj.IsMap())
    {
        parse_error(where, "expected an issue object");
    }

    IssueRecord issue;
    issue.id = scalar_or_empty(obj["id"]);
    if (issue.id.empty())
    {
        parse_error(where, "issue has no id");
    }
    issue.title = scalar_or_empty(obj["title"]);
    issue.status = scalar_or_empty(obj["status"]);
    issue.issue_type = scalar_or_empty(obj["issue_type"]);
    issue.priority = scalar_as<int>(obj["priority"], 0, where, "priority");
    issue.description = scalar_or_empty(obj["description"]);
    issue.design = scalar_or_empty(obj["design"]);
    issue.acceptance_criteria = scalar_or_empty(obj["acceptance_criteria"]);
    issue.notes = scalar_or_empty(obj["notes"]);
    issue.external_ref = scalar_or_empty(obj["external_ref"]);
    issue.created_at = scalar_or_empty(obj["created_at"]);
    issue.updated_at = scalar_or_empty(obj["updated_at"]);
    issue.closed_at = scalar_or_empty(obj["closed_at"]);

    if (const YAML::Node labels = obj["labels"]; labels && labels.IsSequence())
    {
        for (const auto& label : labels)
        {
            std::string text = scalar_or_empty(label);
            if (!text.empty())
            {
                issue.labels.push_back(std::move(text));
            }
        }
    }

    if (const YAML::Node comments = obj["comments"]; comments && comments.IsSequence())
    {
        for (const auto& entry : comments)
        {
            if (!entry.IsMap())
            {
                continue;
            }
            Comment comment;
            comment.id = scalar_as<int64_t>(entry["id"], 0, where, "comments.id");
            comment.issue_id = scalar_or_empty(entry["issue_id"]);
            comment.author = scalar_or_empty(entry["author"]);
            comment.text = scalar_or_empty(entry["text"]);
            comment.created_at = scalar_or_empty(entry["created_at"]);
            issue.comments.push_back(std::move(comment));
        }
    }

    if (const YAML::Node deps = obj["dependencies"]; deps && deps.IsSequence())
    {
        for (const auto& entry : deps)
        {
            if (!entry.IsMap())
            {
                continue;
            }
            Dependency dep;
            dep.target_id = first_scalar(entry, "id", "depends_on_id");
            dep.type = first_scalar(entry, "dependency_type", "type");
            if (!dep.target_id.empty())
            {
                issue.dependencies.push_back(std::move(dep));
            }
        }
    }

    if (const YAML::Node dependents = obj["dependents"]; dependents && dependents.IsSequence())
    {
        for (const auto& entry : dependents)
        {
            if (!entry.IsMap())
            {
                continue;
            }
            Dependent dep;
            dep.id = first_scalar(entry, "id", "issue_id");
            dep.type = first_scalar(entry, "dependency_type", "type");
            if (!dep.id.empty())
            {
                issue.dependents.push_back(std::move(dep));
            }
        }
    }
    return issue;
}

bool is_blank(const std::string& line)
{
    return std::all_of(line.begin(), line.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

/// Value of the `\uXXXX` escape at `pos`, or -1 if there is none.
long escaped_code_unit(const std::string& text, size_t pos)
{
    if (pos + 6 > text.size() || text[pos] != '\\' || text[pos + 1] != 'u')
    {
        return -1;
    }
    long value = 0;
    for (size_t i = pos + 2; i < pos + 6; ++i)
    {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isxdigit(c))
        {
            return -1;
        }
        value = value * 16 + (std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);
    }
    return value;
}

bool is_high_surrogate(long unit)
{
    return unit >= 0xD800 && unit <= 0xDBFF;
}

bool is_low_surrogate(long unit)
{
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

/**
 * @brief Replace JSON surrogate-pair escapes with the UTF-8 they encode.
 *
 * @details
 * yaml-cpp decodes `\uXXXX` one code unit at a time and rejects surrogates,
 * so `\ud83d\ude00` must reach it as the raw four-byte sequence. An unpaired
 * surrogate becomes U+FFFD. Every other escape, `\\` included, is copied
 * unchanged.
 */
std::string join_surrogate_escapes(const std::string& text)
{
    if (text.find("\\u") == std::string::npos)
    {
        return text;
    }

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size())
    {
        if (text[pos] != '\\' || pos + 1 >= text.size())
        {
            out += text[pos++];
            continue;
        }

        const long unit = escaped_code_unit(text, pos);
        if (unit < 0 || !(is_high_surrogate(unit) || is_low_surrogate(unit)))
        {
            out.append(text, pos, 2);
            pos += 2;
            continue;
        }

        const long low = escaped_code_unit(text, pos + 6);
        if (!is_high_surrogate(unit) || !is_low_surrogate(low))
        {
            out += "\\uFFFD";
            pos += 6;
            continue;
        }

        const long code_point = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
        pos += 12;
    }
    return out;
}

std::vector<IssueRecord> read_array(const std::string& text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(join_surrogate_escapes(text));
    }
    catch (const YAML::Exception& e)
    {
        parse_error("line " + std::to_string(e.mark.line + 1), e.msg);
    }
    if (!root.IsSequence())
    {
        parse_error("document", "expected a JSON array of issues");
    }

    std::vector<IssueRecord> issues;
    issues.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i)
    {
        issues.push_back(parse_issue(root[i], "element " + std::to_string(i)));
    }
    return issues;
}

std::vector<IssueRecord> read_lines(const std::string& text)
{
    std::vector<IssueRecord> issues;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        if (is_blank(line))
        {
            continue;
        }
        const std::string where = "line " + std::to_string(line_no);
        YAML::Node obj;
        try
        {
            obj = YAML::Load(join_surrogate_escapes(line));
        }
        catch (const YAML::Exception& e)
        {
            parse_error(where, e.msg);
        }
        issues.push_back(parse_issue(obj, where));
    }
    return issues;
}

} // namespace

std::vector<IssueRecord> SnapshotReader::read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw ForestError(ForestErrorCode::ParseFailed, "Cannot open issue snapshot '" + path + "'");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto issues = read_string(buffer.str());
    ISSUEFOREST_LOG_DEBUG("snapshot loaded",
        {logging::string_field("path", path),
         logging::int_field("issues", static_cast<int64_t>(issues.size()))});
    return issues;
}

std::vector<IssueRecord> SnapshotReader::read_string(const std::string& text)
{
    auto first = std::find_if(text.begin(), text.end(),
                              [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
    if (first == text.end())
    {
        return {};
    }
    if (*first == '[')
    {
        return read_array(text);
    }
    return read_lines(text);
}

} // namespace issueforest

#include "sql_assist/lsp/editor_service.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sql_assist/analysis/column_list.hpp"
#include "sql_assist/analysis/error_position.hpp"
#include "sql_assist/basic/diagnostic.hpp"
#include "sql_assist/basic/source_manager.hpp"
#include "sql_assist/lsp/completion.hpp"
#include "sql_assist/lsp/completion_context.hpp"
#include "sql_assist/lsp/highlighter.hpp"
#include "sql_assist/syntax/lexer.hpp"

namespace sql_assist::lsp
{
namespace
{

using json = nlohmann::json;

json range_to_json(const FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

json diagnostic_to_json(const Diagnostic & d, const SourceFile & source)
{
  json item;
  item["code"] = d.code;
  item["message"] = d.message;
  if (d.label) {
    item["range"] = range_to_json(source.get_full_range(d.label->range));
    if (!d.label->message.empty()) {
      item["label"] = d.label->message;
    }
  }
  if (d.help_message) {
    item["help"] = *d.help_message;
  }
  return item;
}

// Document state. Tokens are computed on first use after each edit.
struct Document
{
  std::string uri;
  SourceFile source;
  std::optional<std::vector<syntax::Token>> tokens;
};

}  // namespace

struct EditorService::Impl
{
  std::unordered_map<std::string, Document> docs;
  catalog::Catalog catalog;

  Document * get_doc(std::string_view uri)
  {
    auto it = docs.find(std::string(uri));
    if (it == docs.end()) {
      return nullptr;
    }
    return &it->second;
  }

  static const std::vector<syntax::Token> & ensure_tokenized(Document & doc)
  {
    if (!doc.tokens) {
      doc.tokens = syntax::tokenize(doc.source.content());
    }
    return *doc.tokens;
  }

  json tokens_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["tokens"] = json::array();

    auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    for (const auto & t : ensure_tokenized(*doc)) {
      json tok;
      tok["kind"] = std::string(syntax::to_string(t.kind));
      tok["value"] = t.value;
      tok["range"] = range_to_json(doc->source.get_full_range(t.range));
      out["tokens"].push_back(std::move(tok));
    }
    return out;
  }

  json column_list_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["found"] = false;

    auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const auto range = analysis::select_column_list_range(doc->source.content());
    if (!range) {
      return out;
    }
    out["found"] = true;
    out["range"] = range_to_json(doc->source.get_full_range(*range));
    out["text"] = std::string(doc->source.get_slice(*range));
    return out;
  }

  json replace_column_list_json_impl(std::string_view uri, std::string_view replacement)
  {
    json out;
    out["uri"] = std::string(uri);
    out["changed"] = false;

    auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    auto text = analysis::replace_select_column_list(doc->source.content(), replacement);
    if (!text) {
      return out;
    }
    out["changed"] = true;
    out["text"] = std::move(*text);
    return out;
  }

  json error_highlight_json_impl(std::string_view uri, std::string_view message)
  {
    json out;
    out["uri"] = std::string(uri);
    out["diagnostics"] = json::array();

    auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    DiagnosticBag diags;
    const auto pos = analysis::relay_remote_error(message, doc->source.content(), diags);
    if (pos) {
      out["position"] = json{{"line", pos->line}, {"column", pos->column}};
    }
    for (const auto & d : diags) {
      const auto r = d.range();
      if (r.is_valid() && !out.contains("range")) {
        out["range"] = range_to_json(doc->source.get_full_range(r));
      }
      out["diagnostics"].push_back(diagnostic_to_json(d, doc->source));
    }
    return out;
  }

  json completion_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    json out;
    out["uri"] = std::string(uri);
    out["prefix"] = "";
    out["items"] = json::array();

    auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const auto text = doc->source.content();
    const auto result = completions(text, byte_offset, catalog.table_names, catalog.fields);

    out["context"] = std::string(
      to_string(determine_context(text.substr(0, result.prefix_range.begin_offset()))));
    out["prefix"] = result.prefix;
    out["replaceRange"] = range_to_json(doc->source.get_full_range(result.prefix_range));

    for (const auto & it : result.items) {
      json item;
      item["label"] = it.display_text;
      item["kind"] = std::string(to_string(it.kind));
      item["kindLabel"] = std::string(it.kind_label());
      if (it.detail) {
        item["detail"] = *it.detail;
      }
      item["insertText"] = it.insert_text;
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  json highlight_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["spans"] = json::array();

    auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    for (const auto & s : classify(doc->source.content())) {
      json span;
      span["style"] = std::string(to_string(s.style));
      span["range"] = range_to_json(doc->source.get_full_range(s.range));
      out["spans"].push_back(std::move(span));
    }
    return out;
  }
};

// =============================================================================
// EditorService public API
// =============================================================================

EditorService::EditorService() : impl_(new Impl()) {}

EditorService::~EditorService() { delete impl_; }

EditorService::EditorService(EditorService && other) noexcept : impl_(other.impl_)
{
  other.impl_ = nullptr;
}

EditorService & EditorService::operator=(EditorService && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

void EditorService::set_document(std::string uri, std::string text)
{
  auto & d = impl_->docs[uri];
  d.uri = std::move(uri);
  d.source.set_content(std::move(text));
  d.tokens.reset();
}

void EditorService::remove_document(std::string_view uri) { impl_->docs.erase(std::string(uri)); }

bool EditorService::has_document(std::string_view uri) const
{
  return impl_->docs.find(std::string(uri)) != impl_->docs.end();
}

void EditorService::set_catalog(catalog::Catalog catalog) { impl_->catalog = std::move(catalog); }

const catalog::Catalog & EditorService::get_catalog() const { return impl_->catalog; }

std::string EditorService::tokens_json(std::string_view uri)
{
  const json j = impl_->tokens_json_impl(uri);
  return j.dump();
}

std::string EditorService::column_list_json(std::string_view uri)
{
  const json j = impl_->column_list_json_impl(uri);
  return j.dump();
}

std::string EditorService::replace_column_list_json(
  std::string_view uri, std::string_view replacement)
{
  const json j = impl_->replace_column_list_json_impl(uri, replacement);
  return j.dump();
}

std::string EditorService::error_highlight_json(std::string_view uri, std::string_view message)
{
  const json j = impl_->error_highlight_json_impl(uri, message);
  return j.dump();
}

std::string EditorService::completion_json(std::string_view uri, uint32_t byte_offset)
{
  const json j = impl_->completion_json_impl(uri, byte_offset);
  return j.dump();
}

std::string EditorService::highlight_json(std::string_view uri)
{
  const json j = impl_->highlight_json_impl(uri);
  return j.dump();
}

}  // namespace sql_assist::lsp

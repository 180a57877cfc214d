#include <robodiff/usd/usda_reader.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <robodiff/errors.h>
#include <robodiff/uri_resolver.h>

namespace robodiff {
namespace usd {

namespace {

enum class TokenType
{
  End,
  Identifier,
  Number,
  String,
  Asset,
  Path,
  Punct,
};

struct Token
{
  TokenType type = TokenType::End;
  std::string text;
  int line = 0;
};

bool isIdentStart(char c)
{
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

enum class ListOp
{
  Explicit,
  Prepend,
  Append,
  Add,
  Delete,
  Reorder,
};

bool isListOp(const std::string& word)
{
  return word == "prepend" || word == "append" || word == "add" || word == "delete" || word == "reorder";
}

ListOp listOpFromString(const std::string& word)
{
  if (word == "prepend")
    return ListOp::Prepend;
  if (word == "append")
    return ListOp::Append;
  if (word == "add")
    return ListOp::Add;
  if (word == "delete")
    return ListOp::Delete;
  if (word == "reorder")
    return ListOp::Reorder;
  return ListOp::Explicit;
}

// Apply a list-op edit to a list of strings.
void applyListOp(std::vector<std::string>& list, const std::vector<std::string>& items, ListOp op)
{
  switch (op)
  {
    case ListOp::Explicit:
      list = items;
      break;
    case ListOp::Delete:
      for (const auto& i : items)
        list.erase(std::remove(list.begin(), list.end(), i), list.end());
      break;
    case ListOp::Reorder:
      break;
    case ListOp::Prepend:
    {
      std::vector<std::string> merged = items;
      for (const auto& i : list)
      {
        if (std::find(merged.begin(), merged.end(), i) == merged.end())
          merged.push_back(i);
      }
      list = std::move(merged);
      break;
    }
    default:
      for (const auto& i : items)
      {
        if (std::find(list.begin(), list.end(), i) == list.end())
          list.push_back(i);
      }
      break;
  }
}

class UsdaParser
{
public:
  UsdaParser(const std::string& text, const std::string& identifier) : text(text), identifier(identifier)
  {
  }

  Layer parse(const std::string& directory)
  {
    if (text.rfind("PXR-USDC", 0) == 0)
      throw ParseError(identifier, "binary USD crate files are not supported, export the layer as .usda");
    if (text.rfind("PK", 0) == 0)
      throw ParseError(identifier, "USDZ packages are not supported, extract the .usda layer");
    if (text.rfind("#usda", 0) != 0)
      throw ParseError(identifier + ":1", "missing '#usda' header");

    Layer layer;
    layer.identifier = identifier;
    layer.directory = directory;

    if (peekPunct("("))
      parseLayerMetadata(layer);

    while (peek().type != TokenType::End)
      layer.root_prims.push_back(parsePrim());
    return layer;
  }

private:
  // ---- lexer ----------------------------------------------------------------

  const Token& peek()
  {
    if (!has_peek)
    {
      peeked = lex();
      has_peek = true;
    }
    return peeked;
  }

  Token next()
  {
    Token t = peek();
    has_peek = false;
    return t;
  }

  bool peekPunct(const char* p)
  {
    return peek().type == TokenType::Punct && peek().text == p;
  }

  bool peekWord(const char* w)
  {
    return peek().type == TokenType::Identifier && peek().text == w;
  }

  void expectPunct(const char* p)
  {
    Token t = next();
    if (t.type != TokenType::Punct || t.text != p)
      fail(t, std::string("expected '") + p + "', got '" + t.text + "'");
  }

  std::string expectName()
  {
    Token t = next();
    if (t.type != TokenType::Identifier && t.type != TokenType::String)
      fail(t, "expected a name, got '" + t.text + "'");
    return t.text;
  }

  [[noreturn]] void fail(const Token& t, const std::string& reason) const
  {
    throw ParseError(identifier + ":" + std::to_string(t.line), reason);
  }

  [[noreturn]] void failHere(const std::string& reason) const
  {
    throw ParseError(identifier + ":" + std::to_string(line), reason);
  }

  void skipSpaceAndComments()
  {
    while (pos < text.size())
    {
      const char c = text[pos];
      if (c == '\n')
      {
        ++line;
        ++pos;
      }
      else if (std::isspace(static_cast<unsigned char>(c)))
      {
        ++pos;
      }
      else if (c == '#')
      {
        while (pos < text.size() && text[pos] != '\n')
          ++pos;
      }
      else
      {
        break;
      }
    }
  }

  Token lex()
  {
    skipSpaceAndComments();

    Token t;
    t.line = line;
    if (pos >= text.size())
      return t;

    const char c = text[pos];
    if (c == '"' || c == '\'')
    {
      t.type = TokenType::String;
      t.text = lexString(c);
    }
    else if (c == '@')
    {
      t.type = TokenType::Asset;
      t.text = lexAsset();
    }
    else if (c == '<')
    {
      const auto end = text.find('>', pos);
      if (end == std::string::npos)
        failHere("unterminated path");
      t.type = TokenType::Path;
      t.text = text.substr(pos + 1, end - pos - 1);
      pos = end + 1;
    }
    else if (std::isdigit(static_cast<unsigned char>(c)) ||
             ((c == '-' || c == '+' || c == '.') && pos + 1 < text.size() &&
              (std::isdigit(static_cast<unsigned char>(text[pos + 1])) || text[pos + 1] == '.')))
    {
      const char* begin = text.c_str() + pos;
      char* end = nullptr;
      std::strtod(begin, &end);
      if (end == begin)
        failHere("invalid number");
      t.type = TokenType::Number;
      t.text.assign(begin, static_cast<std::size_t>(end - begin));
      pos += static_cast<std::size_t>(end - begin);
    }
    else if (c == '-' && pos + 1 < text.size() && isIdentStart(text[pos + 1]))
    {
      // -inf
      ++pos;
      t.type = TokenType::Identifier;
      t.text = "-" + lexIdentifier();
    }
    else if (isIdentStart(c))
    {
      t.type = TokenType::Identifier;
      t.text = lexIdentifier();
    }
    else if (std::string("()[]{}=,;:").find(c) != std::string::npos)
    {
      t.type = TokenType::Punct;
      t.text = std::string(1, c);
      ++pos;
    }
    else
    {
      failHere(std::string("unexpected character '") + c + "'");
    }
    return t;
  }

  std::string lexIdentifier()
  {
    std::string out;
    while (pos < text.size())
    {
      const char c = text[pos];
      if (isIdentChar(c))
      {
        out.push_back(c);
        ++pos;
      }
      else if ((c == ':' || c == '.') && pos + 1 < text.size() && isIdentStart(text[pos + 1]) && !out.empty())
      {
        out.push_back(c);
        ++pos;
      }
      else
      {
        break;
      }
    }
    return out;
  }

  std::string lexString(char quote)
  {
    const bool triple = text.compare(pos, 3, std::string(3, quote)) == 0;
    pos += triple ? 3 : 1;

    std::string out;
    while (true)
    {
      if (pos >= text.size())
        failHere("unterminated string");
      const char c = text[pos];
      if (triple && text.compare(pos, 3, std::string(3, quote)) == 0)
      {
        pos += 3;
        break;
      }
      if (!triple && c == quote)
      {
        ++pos;
        break;
      }
      if (!triple && c == '\n')
        failHere("newline in string");
      if (c == '\n')
        ++line;
      if (c == '\\' && pos + 1 < text.size())
      {
        const char e = text[pos + 1];
        out.push_back(e == 'n' ? '\n' : e == 't' ? '\t' : e);
        pos += 2;
        continue;
      }
      out.push_back(c);
      ++pos;
    }
    return out;
  }

  std::string lexAsset()
  {
    const bool triple = text.compare(pos, 3, "@@@") == 0;
    const std::string delim = triple ? "@@@" : "@";
    pos += delim.size();
    const auto end = text.find(delim, pos);
    if (end == std::string::npos)
      failHere("unterminated asset path");
    std::string out = text.substr(pos, end - pos);
    pos = end + delim.size();
    return out;
  }

  // ---- values ---------------------------------------------------------------

  Value parseValue()
  {
    Token t = next();
    Value v;
    switch (t.type)
    {
      case TokenType::Number:
        v.kind = Value::Kind::Number;
        v.number = std::strtod(t.text.c_str(), nullptr);
        return v;
      case TokenType::String:
        v.kind = Value::Kind::String;
        v.text = t.text;
        return v;
      case TokenType::Identifier:
        if (t.text == "inf" || t.text == "-inf" || t.text == "nan")
        {
          v.kind = Value::Kind::Number;
          v.number = t.text == "nan" ? std::numeric_limits<double>::quiet_NaN() :
                                       (t.text == "inf" ? 1.0 : -1.0) * std::numeric_limits<double>::infinity();
          return v;
        }
        v.kind = t.text == "None" ? Value::Kind::None : Value::Kind::Token;
        v.text = t.text;
        return v;
      case TokenType::Asset:
        v.kind = Value::Kind::Asset;
        v.text = t.text;
        if (peek().type == TokenType::Path)
          v.target = next().text;
        if (peekPunct("("))
          skipBalanced();  // layer offset
        return v;
      case TokenType::Path:
        v.kind = Value::Kind::Path;
        v.text = t.text;
        if (peekPunct("("))
          skipBalanced();  // layer offset of an internal reference
        return v;
      case TokenType::Punct:
        if (t.text == "(")
          return parseSequence(Value::Kind::Tuple, ")");
        if (t.text == "[")
          return parseSequence(Value::Kind::List, "]");
        if (t.text == "{")
          return parseDictionary();
        break;
      default:
        break;
    }
    fail(t, "unexpected '" + t.text + "' in value");
  }

  Value parseSequence(Value::Kind kind, const char* close)
  {
    Value v;
    v.kind = kind;
    while (!peekPunct(close))
    {
      if (peek().type == TokenType::End)
        failHere("unterminated list");
      v.items.push_back(parseValue());
      if (peekPunct(","))
        next();
    }
    next();
    return v;
  }

  Value parseDictionary()
  {
    Value v;
    v.kind = Value::Kind::Dictionary;
    while (!peekPunct("}"))
    {
      if (peek().type == TokenType::End)
        failHere("unterminated dictionary");
      if (peekPunct(",") || peekPunct(";"))
      {
        next();
        continue;
      }

      Token first = next();
      if ((first.type == TokenType::Number || first.type == TokenType::String) && peekPunct(":"))
      {
        // time sample or string keyed entry
        next();
        v.keys.push_back(first.text);
        v.items.push_back(parseValue());
        continue;
      }
      if (first.type != TokenType::Identifier)
        fail(first, "unexpected '" + first.text + "' in dictionary");
      if (peekPunct("["))
      {
        next();
        expectPunct("]");
      }
      const std::string key = expectName();
      expectPunct("=");
      v.keys.push_back(key);
      v.items.push_back(parseValue());
    }
    next();
    return v;
  }

  void skipBalanced()
  {
    Token open = next();
    const std::string close = open.text == "(" ? ")" : open.text == "[" ? "]" : "}";
    int depth = 1;
    while (depth > 0)
    {
      Token t = next();
      if (t.type == TokenType::End)
        fail(open, "unbalanced '" + open.text + "'");
      if (t.type != TokenType::Punct)
        continue;
      if (t.text == open.text)
        ++depth;
      else if (t.text == close)
        --depth;
    }
  }

  // ---- layer and prims -------------------------------------------------------

  void parseLayerMetadata(Layer& layer)
  {
    expectPunct("(");
    while (!peekPunct(")"))
    {
      if (peek().type == TokenType::End)
        failHere("unterminated layer metadata");
      if (peek().type == TokenType::String)
      {
        next();  // doc string
        continue;
      }
      if (peekPunct(";"))
      {
        next();
        continue;
      }

      Token key = next();
      ListOp op = ListOp::Explicit;
      if (key.type == TokenType::Identifier && isListOp(key.text) && peek().type == TokenType::Identifier)
      {
        op = listOpFromString(key.text);
        key = next();
      }
      if (key.type != TokenType::Identifier)
        fail(key, "unexpected '" + key.text + "' in layer metadata");
      expectPunct("=");
      const Value value = parseValue();

      try
      {
        if (key.text == "defaultPrim")
          layer.default_prim = toText(value);
        else if (key.text == "metersPerUnit")
          layer.meters_per_unit = toNumber(value);
        else if (key.text == "subLayers")
          applyListOp(layer.sublayers, toTexts(value), op);
      }
      catch (const std::invalid_argument& e)
      {
        fail(key, key.text + ": " + e.what());
      }
    }
    next();
  }

  PrimSpec parsePrim()
  {
    Token spec = next();
    PrimSpec prim;
    prim.line = spec.line;
    if (spec.type == TokenType::Identifier && spec.text == "def")
      prim.specifier = Specifier::Def;
    else if (spec.type == TokenType::Identifier && spec.text == "over")
      prim.specifier = Specifier::Over;
    else if (spec.type == TokenType::Identifier && spec.text == "class")
      prim.specifier = Specifier::Class;
    else
      fail(spec, "expected 'def', 'over' or 'class', got '" + spec.text + "'");

    if (peek().type == TokenType::Identifier)
      prim.type_name = next().text;

    Token name = next();
    if (name.type != TokenType::String)
      fail(name, "expected prim name string");
    prim.name = name.text;

    if (peekPunct("("))
      parsePrimMetadata(prim);

    expectPunct("{");
    parsePrimBody(prim);
    return prim;
  }

  void parsePrimMetadata(PrimSpec& prim)
  {
    expectPunct("(");
    while (!peekPunct(")"))
    {
      if (peek().type == TokenType::End)
        failHere("unterminated prim metadata");
      if (peek().type == TokenType::String)
      {
        next();
        continue;
      }
      if (peekPunct(";"))
      {
        next();
        continue;
      }

      Token key = next();
      ListOp op = ListOp::Explicit;
      if (key.type == TokenType::Identifier && isListOp(key.text) && peek().type == TokenType::Identifier)
      {
        op = listOpFromString(key.text);
        key = next();
      }
      if (key.type != TokenType::Identifier)
        fail(key, "unexpected '" + key.text + "' in prim metadata");
      expectPunct("=");
      const Value value = parseValue();

      try
      {
        if (key.text == "apiSchemas")
          applyListOp(prim.api_schemas, toTexts(value), op);
        else if (key.text == "references")
          applyArcs(prim.references, value, op);
        else if (key.text == "payload")
          applyArcs(prim.payloads, value, op);
        else if (key.text == "inherits")
          applyListOp(prim.inherits, toTexts(value), op);
      }
      catch (const std::invalid_argument& e)
      {
        fail(key, key.text + ": " + e.what());
      }
    }
    next();
  }

  static void applyArcs(std::vector<Arc>& arcs, const Value& value, ListOp op)
  {
    std::vector<Arc> items;
    auto add = [&](const Value& v) {
      if (v.kind == Value::Kind::Asset)
        items.push_back(Arc{ v.text, v.target });
      else if (v.kind == Value::Kind::Path)
        items.push_back(Arc{ "", v.text });
      else if (v.kind != Value::Kind::None)
        throw std::invalid_argument("expected asset or path");
    };
    if (value.kind == Value::Kind::List)
    {
      for (const auto& v : value.items)
        add(v);
    }
    else
    {
      add(value);
    }

    auto same = [](const Arc& a, const Arc& b) { return a.asset == b.asset && a.prim_path == b.prim_path; };
    switch (op)
    {
      case ListOp::Explicit:
        arcs = items;
        break;
      case ListOp::Delete:
        for (const auto& i : items)
          arcs.erase(std::remove_if(arcs.begin(), arcs.end(), [&](const Arc& a) { return same(a, i); }), arcs.end());
        break;
      case ListOp::Reorder:
        break;
      case ListOp::Prepend:
        arcs.insert(arcs.begin(), items.begin(), items.end());
        break;
      default:
        arcs.insert(arcs.end(), items.begin(), items.end());
        break;
    }
  }

  void parsePrimBody(PrimSpec& prim)
  {
    while (!peekPunct("}"))
    {
      const Token& t = peek();
      if (t.type == TokenType::End)
        failHere("unterminated prim '" + prim.name + "'");
      if (peekPunct(";"))
      {
        next();
        continue;
      }
      if (t.type != TokenType::Identifier)
        fail(t, "unexpected '" + t.text + "' in prim '" + prim.name + "'");

      if (t.text == "def" || t.text == "over" || t.text == "class")
      {
        prim.children.push_back(parsePrim());
      }
      else if (t.text == "variantSet")
      {
        // Variants are not composed.
        next();
        next();  // name
        expectPunct("=");
        skipBalanced();
      }
      else
      {
        parseProperty(prim);
      }
    }
    next();
  }

  void parseProperty(PrimSpec& prim)
  {
    ListOp op = ListOp::Explicit;
    Token t = next();
    const int prop_line = t.line;

    while (t.type == TokenType::Identifier &&
           (t.text == "custom" || t.text == "uniform" || t.text == "varying" || t.text == "config" ||
            isListOp(t.text)))
    {
      if (isListOp(t.text))
        op = listOpFromString(t.text);
      t = next();
    }

    if (op == ListOp::Reorder)
    {
      // reorder nameChildren / properties = [...]
      expectPunct("=");
      parseValue();
      return;
    }

    if (t.type == TokenType::Identifier && t.text == "rel")
    {
      const std::string name = expectName();
      Relationship& rel = prim.relationships[name];
      rel.line = prop_line;
      if (peekPunct("="))
      {
        next();
        const Value value = parseValue();
        std::vector<std::string> targets;
        if (value.kind == Value::Kind::Path)
          targets.push_back(value.text);
        else if (value.kind == Value::Kind::List)
        {
          for (const auto& v : value.items)
          {
            if (v.kind != Value::Kind::Path)
              fail(t, "relationship '" + name + "' expects paths");
            targets.push_back(v.text);
          }
        }
        else if (value.kind != Value::Kind::None)
          fail(t, "relationship '" + name + "' expects paths");
        applyListOp(rel.targets, targets, op);
      }
      if (peekPunct("("))
        skipBalanced();
      return;
    }

    if (t.type != TokenType::Identifier)
      fail(t, "expected attribute type, got '" + t.text + "'");

    Attribute attr;
    attr.type_name = t.text;
    attr.line = prop_line;
    if (peekPunct("["))
    {
      next();
      expectPunct("]");
      attr.type_name += "[]";
    }

    const std::string name = expectName();
    if (peekPunct("="))
    {
      next();
      attr.value = parseValue();
      attr.has_value = true;
    }
    if (peekPunct("("))
      skipBalanced();

    prim.attributes[name] = std::move(attr);
  }

  const std::string& text;
  std::string identifier;
  std::size_t pos = 0;
  int line = 1;
  Token peeked;
  bool has_peek = false;
};

}  // namespace

double toNumber(const Value& v)
{
  if (v.kind == Value::Kind::Number)
    return v.number;
  if (v.kind == Value::Kind::Token && (v.text == "true" || v.text == "false"))
    return v.text == "true" ? 1.0 : 0.0;
  throw std::invalid_argument("expected a number");
}

std::vector<double> toNumbers(const Value& v)
{
  std::vector<double> out;
  if (v.kind == Value::Kind::Tuple || v.kind == Value::Kind::List)
  {
    for (const auto& item : v.items)
    {
      auto sub = toNumbers(item);
      out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
  }
  out.push_back(toNumber(v));
  return out;
}

Eigen::Vector3d toVector3(const Value& v)
{
  auto n = toNumbers(v);
  if (n.size() != 3)
    throw std::invalid_argument("expected 3 numbers, got " + std::to_string(n.size()));
  return Eigen::Vector3d(n[0], n[1], n[2]);
}

Eigen::Quaterniond toQuaternion(const Value& v)
{
  auto n = toNumbers(v);
  if (n.size() != 4)
    throw std::invalid_argument("expected 4 numbers, got " + std::to_string(n.size()));
  return Eigen::Quaterniond(n[0], n[1], n[2], n[3]);
}

Eigen::Matrix4d toMatrix4(const Value& v)
{
  auto n = toNumbers(v);
  if (n.size() != 16)
    throw std::invalid_argument("expected 16 numbers, got " + std::to_string(n.size()));
  Eigen::Matrix4d m;
  for (int r = 0; r < 4; ++r)
  {
    for (int c = 0; c < 4; ++c)
      m(r, c) = n[r * 4 + c];
  }
  return m;
}

std::string toText(const Value& v)
{
  if (v.kind == Value::Kind::String || v.kind == Value::Kind::Token || v.kind == Value::Kind::Asset ||
      v.kind == Value::Kind::Path)
    return v.text;
  throw std::invalid_argument("expected a string");
}

std::vector<std::string> toTexts(const Value& v)
{
  std::vector<std::string> out;
  if (v.kind == Value::Kind::None)
    return out;
  if (v.kind == Value::Kind::List)
  {
    for (const auto& item : v.items)
      out.push_back(toText(item));
    return out;
  }
  out.push_back(toText(v));
  return out;
}

const PrimSpec* PrimSpec::child(const std::string& child_name) const
{
  for (const auto& c : children)
  {
    if (c.name == child_name)
      return &c;
  }
  return nullptr;
}

const PrimSpec* Layer::findPrim(const std::string& path) const
{
  if (path.empty() || path[0] != '/')
    return nullptr;

  const PrimSpec* current = nullptr;
  std::size_t begin = 1;
  while (begin <= path.size())
  {
    std::size_t end = path.find('/', begin);
    if (end == std::string::npos)
      end = path.size();
    const std::string name = path.substr(begin, end - begin);
    if (name.empty())
      return current;

    const PrimSpec* found = nullptr;
    if (!current)
    {
      for (const auto& p : root_prims)
      {
        if (p.name == name)
        {
          found = &p;
          break;
        }
      }
    }
    else
    {
      found = current->child(name);
    }
    if (!found)
      return nullptr;
    current = found;
    begin = end + 1;
  }
  return current;
}

Layer parseLayer(const std::string& text, const std::string& identifier, const std::string& directory)
{
  UsdaParser parser(text, identifier);
  return parser.parse(directory);
}

Layer loadLayer(const std::string& filename)
{
  return parseLayer(readFile(filename), filename, getDirectory(filename));
}

}  // namespace usd
}  // namespace robodiff

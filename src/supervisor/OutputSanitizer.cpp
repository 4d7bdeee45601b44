#include "OutputSanitizer.hpp"

#include "SupervisorErrors.hpp"

namespace aic {
namespace {
// Unlike split(), keeps empty trailing lines so joining restores the text.
vector<string> splitLines(const string& text) {
  vector<string> lines;
  size_t start = 0;
  while (true) {
    size_t end = text.find('\n', start);
    if (end == string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

string joinLines(const vector<string>& lines) {
  string out;
  for (size_t a = 0; a < lines.size(); a++) {
    if (a) {
      out += '\n';
    }
    out += lines[a];
  }
  return out;
}

std::regex compile(const string& pattern, bool ignoreCase) {
  auto flags = std::regex::ECMAScript;
  if (ignoreCase) {
    flags |= std::regex::icase;
  }
  try {
    return std::regex(pattern, flags);
  } catch (const std::regex_error& re) {
    throw ConfigurationError("Invalid pattern '" + pattern + "': " +
                             re.what());
  }
}

bool matchesAny(const vector<std::regex>& patterns, const string& line) {
  for (const auto& it : patterns) {
    if (std::regex_search(line, it)) {
      return true;
    }
  }
  return false;
}
}  // namespace

string AnsiSanitizer::sanitize(const string& raw) const {
  return tidy(resolveCarriageReturns(stripEscapes(raw)));
}

string AnsiSanitizer::stripEscapes(const string& raw) {
  string out;
  out.reserve(raw.size());
  size_t i = 0;
  const size_t n = raw.size();
  while (i < n) {
    unsigned char c = raw[i];
    if (c == 0x1b) {
      if (i + 1 >= n) {
        // Truncated sequence at the end of the capture
        break;
      }
      char next = raw[i + 1];
      if (next == '[') {
        // CSI: parameter and intermediate bytes, then one final byte
        size_t j = i + 2;
        while (j < n && (unsigned char)raw[j] >= 0x20 &&
               (unsigned char)raw[j] <= 0x3f) {
          j++;
        }
        i = (j < n) ? j + 1 : n;
        continue;
      }
      if (next == ']' || next == 'P' || next == 'X' || next == '^' ||
          next == '_') {
        // String sequences run until BEL or ST
        size_t j = i + 2;
        while (j < n) {
          if (raw[j] == 0x07) {
            j++;
            break;
          }
          if (raw[j] == 0x1b && j + 1 < n && raw[j + 1] == '\\') {
            j += 2;
            break;
          }
          j++;
        }
        i = j;
        continue;
      }
      if (string("()*+-./#%").find(next) != string::npos) {
        // Charset designation carries one more byte
        i = min(n, i + 3);
        continue;
      }
      i += 2;
      continue;
    }
    if ((c < 0x20 && c != '\n' && c != '\r' && c != '\t') || c == 0x7f) {
      i++;
      continue;
    }
    out.push_back(raw[i]);
    i++;
  }
  return out;
}

string AnsiSanitizer::resolveCarriageReturns(const string& text) {
  string normalized = text;
  replaceAll(normalized, "\r\n", "\n");
  vector<string> lines = splitLines(normalized);
  for (auto& line : lines) {
    if (line.find('\r') == string::npos) {
      continue;
    }
    string last;
    for (const auto& segment : split(line, '\r')) {
      if (!trim(segment).empty()) {
        last = segment;
      }
    }
    line = last;
  }
  return joinLines(lines);
}

string AnsiSanitizer::tidy(const string& text) {
  vector<string> lines = splitLines(text);
  vector<string> kept;
  bool previousBlank = false;
  for (auto& line : lines) {
    size_t end = line.find_last_not_of(" \t\f\v");
    string stripped =
        (end == string::npos) ? string() : line.substr(0, end + 1);
    bool blank = stripped.empty();
    if (blank && previousBlank) {
      continue;
    }
    previousBlank = blank;
    kept.push_back(stripped);
  }
  return trim(joinLines(kept));
}

PromptSanitizer::PromptSanitizer(const string& promptPattern)
    : prompt(compile(promptPattern, false)) {
  if (promptPattern.empty()) {
    throw ConfigurationError("The prompt sanitizer needs a prompt_pattern");
  }
}

string PromptSanitizer::sanitize(const string& raw) const {
  vector<string> kept;
  for (const auto& line : splitLines(AnsiSanitizer::sanitize(raw))) {
    if (std::regex_search(trim(line), prompt)) {
      continue;
    }
    kept.push_back(line);
  }
  return tidy(joinLines(kept));
}

void ChromeSanitizer::addGlyphs(const vector<string>& _glyphs) {
  glyphs.insert(glyphs.end(), _glyphs.begin(), _glyphs.end());
}

void ChromeSanitizer::addInlinePattern(const string& pattern,
                                       bool ignoreCase) {
  inlinePatterns.push_back(compile(pattern, ignoreCase));
}

void ChromeSanitizer::addLinePattern(const string& pattern, bool ignoreCase) {
  linePatterns.push_back(compile(pattern, ignoreCase));
}

void ChromeSanitizer::addRedrawMarker(const string& pattern) {
  redrawMarkers.push_back(compile(pattern, true));
}

string ChromeSanitizer::sanitize(const string& raw) const {
  string text = resolveCarriageReturns(stripEscapes(raw));
  for (const auto& glyph : glyphs) {
    replaceAll(text, glyph, "");
  }

  vector<string> kept;
  for (auto line : splitLines(text)) {
    if (matchesAny(linePatterns, line)) {
      continue;
    }
    for (const auto& it : inlinePatterns) {
      line = std::regex_replace(line, it, "");
    }
    if (matchesAny(linePatterns, line)) {
      continue;
    }
    kept.push_back(line);
  }
  return tidy(cutAtLastMarker(joinLines(kept)));
}

string ChromeSanitizer::cutAtLastMarker(const string& text) const {
  size_t lastEnd = 0;
  for (const auto& marker : redrawMarkers) {
    auto begin = std::sregex_iterator(text.begin(), text.end(), marker);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      size_t end = size_t(it->position(0) + it->length(0));
      lastEnd = max(lastEnd, end);
    }
  }
  if (lastEnd > 0) {
    return text.substr(lastEnd);
  }
  if (!answerMarker.empty()) {
    size_t pos = text.rfind(answerMarker);
    if (pos != string::npos) {
      return text.substr(pos + answerMarker.length());
    }
  }
  return text;
}

shared_ptr<ChromeSanitizer> ChromeSanitizer::claudeCode() {
  auto s = make_shared<ChromeSanitizer>();
  s->addGlyphs({"✻", "✽", "✶", "✳", "✢", "⏺", "⎿"});
  s->addGlyphs({"╭", "╮", "╰", "╯", "│", "─"});
  s->addLinePattern("^\\s*>\\s*$");
  s->addLinePattern("^\\s*\\?\\s*for shortcuts\\s*$");
  s->addLinePattern("esc to interrupt", true);
  s->addLinePattern("^\\s*Try \".*\"\\s*$");
  s->addLinePattern("^\\s*Welcome to Claude Code");
  s->addLinePattern("^\\s*/help for help");
  s->addLinePattern("^\\s*cwd: ");
  s->addLinePattern("^\\s*(auto-accept edits|bypass permissions|plan mode) on",
                    true);
  s->addInlinePattern("\\(ctrl\\+\\w to \\w+\\)", true);
  return s;
}

shared_ptr<ChromeSanitizer> ChromeSanitizer::geminiCli() {
  auto s = make_shared<ChromeSanitizer>();
  s->addGlyphs({"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"});
  s->addGlyphs({"╭", "╮", "╰", "╯", "│", "─", "┌", "┐", "└", "┘", "├", "┤",
                "┬", "┴", "┼", "║", "═", "╔", "╗", "╚", "╝", "╠", "╣", "╦",
                "╩", "╬"});
  s->addLinePattern("^\\s*Using:.*MCP servers?\\s*$");
  s->addLinePattern("^\\s*~/.*$");
  s->addLinePattern("^\\s*no sandbox.*$", true);
  s->addLinePattern("^\\s*auto\\s*$");
  s->addLinePattern("^\\s*Reading.*\\(esc to cancel.*\\)\\s*$");
  s->addLinePattern("^\\s*Type your message or @path.*$");
  s->addLinePattern("^\\s*>\\s*Type your message.*$");
  s->addLinePattern("^\\s*\\?\\s*for shortcuts\\s*$");
  s->addLinePattern("^\\s*Try \".*\"\\s*$");
  s->addLinePattern("^\\s*∴ Thought for.*$");
  s->addLinePattern("^\\s*✽ Incubating.*$");
  s->addLinePattern("^\\s*(✓|✗)\\s+\\w+.*$");
  s->addLinePattern("^\\s*>\\s*$");
  s->addInlinePattern("Loaded cached credentials\\.?\\s*");
  s->addInlinePattern("\\(ctrl\\+o to show thinking\\)", true);
  s->addInlinePattern("\\(esc to interrupt\\)", true);
  s->addInlinePattern("\\(esc to cancel.*\\)", true);
  s->addInlinePattern("\\.\\.\\.\\s*generating more\\s*\\.\\.\\.", true);
  // Gemini redraws the whole answer after each of these
  s->addRedrawMarker("Defining the Response Strategy");
  s->addRedrawMarker("Formulating\\s+\\w+\\s+Code");
  s->addRedrawMarker("Formulating\\s+\\w+\\s+Response");
  s->addRedrawMarker("Considering\\s+the\\s+Response\\s+Format");
  s->addRedrawMarker("Presenting\\s+the\\s+Code");
  s->addRedrawMarker("Presenting\\s+the\\s+Response");
  s->addRedrawMarker("Providing\\s+\\w+\\s+Code\\s+Example");
  s->addRedrawMarker("Generating\\s+\\w+\\s+Code");
  s->addRedrawMarker("Writing\\s+the\\s+Code");
  s->setAnswerMarker("✦");
  return s;
}

SanitizerRegistry::SanitizerRegistry() : fallback(new AnsiSanitizer()) {}

void SanitizerRegistry::set(const string& tool,
                            shared_ptr<OutputSanitizer> sanitizer) {
  sanitizers[tool] = sanitizer;
}

shared_ptr<OutputSanitizer> SanitizerRegistry::get(const string& tool) const {
  auto it = sanitizers.find(tool);
  if (it == sanitizers.end()) {
    return fallback;
  }
  return it->second;
}

string SanitizerRegistry::sanitize(const string& tool,
                                   const string& raw) const {
  return get(tool)->sanitize(raw);
}

shared_ptr<OutputSanitizer> SanitizerRegistry::create(
    const string& kind, const string& promptPattern) {
  if (kind.empty() || kind == "ansi") {
    return make_shared<AnsiSanitizer>();
  }
  if (kind == "prompt") {
    return make_shared<PromptSanitizer>(promptPattern);
  }
  if (kind == "claude") {
    return ChromeSanitizer::claudeCode();
  }
  if (kind == "gemini") {
    return ChromeSanitizer::geminiCli();
  }
  throw ConfigurationError("Unknown sanitizer '" + kind +
                           "' (expected ansi, prompt, claude or gemini)");
}
}  // namespace aic

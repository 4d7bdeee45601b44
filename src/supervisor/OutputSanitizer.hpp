#ifndef __AIC_OUTPUT_SANITIZER_HPP__
#define __AIC_OUTPUT_SANITIZER_HPP__

#include "Headers.hpp"

namespace aic {
/**
 * @brief Turns raw pty bytes captured from one tool into plain text.
 *
 * Implementations only remove presentation artifacts (escape sequences,
 * spinners, UI chrome) and must be idempotent: sanitizing clean text returns
 * it unchanged.  Output a sanitizer does not recognize passes through.
 */
class OutputSanitizer {
 public:
  virtual ~OutputSanitizer() {}

  virtual string sanitize(const string& raw) const = 0;
};

/**
 * @brief Removes terminal control sequences and resolves line overwrites.
 */
class AnsiSanitizer : public OutputSanitizer {
 public:
  virtual string sanitize(const string& raw) const;

  /**
   * @brief Drops CSI, OSC, DCS and two/three byte ESC sequences as well as
   * stray C0 control bytes other than tab, CR and LF.
   */
  static string stripEscapes(const string& raw);

  /**
   * @brief Converts CRLF to LF and keeps only the last non-empty segment of a
   * line that was rewritten with a bare CR.
   */
  static string resolveCarriageReturns(const string& text);

  /**
   * @brief Strips trailing blanks from each line, squeezes runs of blank
   * lines to one and trims the result.
   */
  static string tidy(const string& text);
};

/**
 * @brief AnsiSanitizer that also removes the tool's input prompt lines.
 */
class PromptSanitizer : public AnsiSanitizer {
 public:
  explicit PromptSanitizer(const string& promptPattern);

  virtual string sanitize(const string& raw) const;

 protected:
  std::regex prompt;
};

/**
 * @brief Sanitizer for full-screen assistant UIs.
 *
 * Besides escape sequences it removes glyphs (spinner frames, box drawing),
 * erases inline hints, drops whole status lines, and for UIs that redraw the
 * answer from the start keeps only what follows the last redraw marker.
 */
class ChromeSanitizer : public AnsiSanitizer {
 public:
  ChromeSanitizer() {}

  virtual string sanitize(const string& raw) const;

  /** @brief Removes every occurrence of a (possibly multibyte) glyph. */
  void addGlyphs(const vector<string>& glyphs);
  /** @brief Erases matches of `pattern` wherever they occur in a line. */
  void addInlinePattern(const string& pattern, bool ignoreCase = false);
  /** @brief Drops every line matching `pattern`. */
  void addLinePattern(const string& pattern, bool ignoreCase = false);
  /** @brief Keeps only the text after the last match of any such pattern. */
  void addRedrawMarker(const string& pattern);
  /**
   * @brief Fallback to the redraw markers: keep the text after the last
   * occurrence of `marker`.
   */
  void setAnswerMarker(const string& marker) { answerMarker = marker; }

  static shared_ptr<ChromeSanitizer> claudeCode();
  static shared_ptr<ChromeSanitizer> geminiCli();

 protected:
  string cutAtLastMarker(const string& text) const;

  vector<string> glyphs;
  vector<std::regex> inlinePatterns;
  vector<std::regex> linePatterns;
  vector<std::regex> redrawMarkers;
  string answerMarker;
};

/**
 * @brief Maps each tool name to its sanitizer.
 *
 * Tools without an entry use a shared AnsiSanitizer.
 */
class SanitizerRegistry {
 public:
  SanitizerRegistry();

  void set(const string& tool, shared_ptr<OutputSanitizer> sanitizer);
  shared_ptr<OutputSanitizer> get(const string& tool) const;
  string sanitize(const string& tool, const string& raw) const;

  /**
   * @brief Builds a sanitizer from its config name (ansi, prompt, claude or
   * gemini).
   * @throws ConfigurationError for an unknown kind or a bad prompt pattern.
   */
  static shared_ptr<OutputSanitizer> create(const string& kind,
                                            const string& promptPattern);

 protected:
  map<string, shared_ptr<OutputSanitizer>> sanitizers;
  shared_ptr<OutputSanitizer> fallback;
};
}  // namespace aic

#endif  // __AIC_OUTPUT_SANITIZER_HPP__

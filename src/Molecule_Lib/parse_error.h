#ifndef MOLECULE_LIB_PARSE_ERROR_H_
#define MOLECULE_LIB_PARSE_ERROR_H_

#include <iostream>
#include <string>
#include <string_view>

namespace smigraph {

// Malformed characters, malformed text, or well formed text that
// does not describe a valid molecule.
enum class ParseErrorKind {
  kNone,
  kLexError,
  kSyntaxError,
  kSemanticError
};

extern const char * parse_error_kind_name(ParseErrorKind kind);

// The first problem found while reading a smiles.
// Columns are 0 based offsets into the smiles. A column equal to
// the length of the smiles means the problem was found at the end.

class ParseError {
  private:
    ParseErrorKind _kind;

    int _column;
    // One past the last offending character.
    int _end;

    std::string _message;

  public:
    ParseError();

    void clear();

    // Always returns 0 so callers can write `return error.Set(...)`.
    int Set(ParseErrorKind kind, int column, int end, std::string_view message);
    int Set(ParseErrorKind kind, int column, std::string_view message) {
      return Set(kind, column, column + 1, message);
    }

    int is_set() const { return ParseErrorKind::kNone != _kind;}

    ParseErrorKind kind() const { return _kind;}
    int column() const { return _column;}
    int end() const { return _end;}
    const std::string & message() const { return _message;}

    // `smiles` followed by a line with carets under the offending
    // characters, then the message.
    std::string Render(std::string_view smiles) const;
};

extern std::ostream & operator<<(std::ostream &, const ParseError &);

}  // namespace smigraph

#endif  // MOLECULE_LIB_PARSE_ERROR_H_

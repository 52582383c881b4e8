#include "error.hpp"
#include "lexer.hpp"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include <optional>
#include <system_error>
#include <vector>

using namespace llvm;

static cl::opt<std::string> InputFilename(cl::Positional,
                                          cl::desc("<input file>"),
                                          cl::Required);

static cl::opt<bool>
    NoPositions("no-positions",
                cl::desc("Do not print line and column for each token"));

static cl::opt<bool>
    StopOnError("stop-on-error",
                cl::desc("Stop scanning at the first bad token"));

static cl::opt<bool>
    Summary("summary",
            cl::desc("Print the number of tokens and errors at the end"));

static void printToken(const impscan::Token &tok, raw_ostream &os) {
  os << "[" << impscan::to_string(tok.kind) << "] '" << tok.lexeme << "'";
  if (!NoPositions) {
    os << " (line " << tok.line << ", col " << tok.column << ")";
  }
  os << "\n";
}

static void printSourceLine(StringRef source, size_t line, size_t column,
                            size_t end_column, raw_ostream &os) {
  SmallVector<StringRef, 32> lines;
  source.split(lines, '\n');

  if (line < 1 || line > lines.size()) {
    return;
  }

  StringRef lineContent = lines[line - 1];
  os << "  " << line << " | " << lineContent << "\n";
  os << "    | ";

  for (size_t i = 1; i < column; ++i) {
    os << " ";
  }

  WithColor(os, raw_ostream::RED, true) << "^";
  for (size_t i = column + 1; i < end_column; ++i) {
    WithColor(os, raw_ostream::RED) << "~";
  }

  os << "\n";
}

static impscan::Diagnostic invalidTokenDiagnostic(const impscan::Token &tok) {
  std::string message;
  raw_string_ostream msg(message);
  msg << "unexpected character '";
  printEscapedString(tok.lexeme, msg);
  msg << "'";
  msg.flush();
  return impscan::Diagnostic(message, tok.line, tok.column, tok.end_column);
}

static void reportDiagnostic(const impscan::Diagnostic &diag,
                             StringRef filename, StringRef source) {
  WithColor::error(errs(), "impscan")
      << "lexer error at " << filename << ":" << diag.line << ":"
      << diag.column << ": " << diag.message << "\n";
  printSourceLine(source, diag.line, diag.column, diag.end_column, errs());
}

static int runLexer(StringRef filename) {
  auto bufferOrErr = MemoryBuffer::getFileOrSTDIN(filename);
  if (std::error_code ec = bufferOrErr.getError()) {
    WithColor::error(errs(), "impscan")
        << "cannot open file '" << filename << "': " << ec.message() << "\n";
    return 1;
  }

  std::unique_ptr<MemoryBuffer> buffer = std::move(*bufferOrErr);
  StringRef source = buffer->getBuffer();
  impscan::Lexer lexer(source);

  size_t tokenCount = 0;
  std::vector<impscan::Diagnostic> diagnostics;
  for (;;) {
    auto tokOrErr = lexer.next_token();
    if (!tokOrErr) {
      handleAllErrors(tokOrErr.takeError(),
                      [&](const impscan::NumericOverflowError &err) {
                        diagnostics.emplace_back(err.message(), err.line(),
                                                 err.column(),
                                                 err.end_column());
                      });
      reportDiagnostic(diagnostics.back(), filename, source);
      if (StopOnError) {
        break;
      }
      continue;
    }

    const std::optional<impscan::Token> &tok = *tokOrErr;
    if (!tok) {
      break;
    }

    if (tok->kind == impscan::TokenKind::Invalid) {
      diagnostics.push_back(invalidTokenDiagnostic(*tok));
      reportDiagnostic(diagnostics.back(), filename, source);
      if (StopOnError) {
        break;
      }
      continue;
    }

    ++tokenCount;
    printToken(*tok, outs());
  }

  if (Summary) {
    outs() << tokenCount << " tokens, " << diagnostics.size() << " errors\n";
  }

  return diagnostics.empty() ? 0 : 1;
}

int main(int argc, char **argv) {
  cl::ParseCommandLineOptions(argc, argv, "impscan lexical scanner\n");

  return runLexer(InputFilename);
}

#include "ast.h"

namespace interp {

namespace {

const char* kBinaryOpSymbolTable[] = {
#define X(name, symbol) symbol,
  ENUM_BINARY_OP_
#undef X
};

} // namespace

const char* BinaryOpSymbol(BinaryOp op) {
  return kBinaryOpSymbolTable[(int)op];
}

} // namespace interp

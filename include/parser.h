#ifndef LUW_PARSER_H
#define LUW_PARSER_H

#include "ast.h"
#include "error.h"
#include "token.h"

/* Builds a NODE_PROGRAM from `tokens`. Returns nullptr and fills `err`
 * with a ParseError at the first malformed statement. */
ASTNode* parser_parse(TokenList* tokens, LuwError* err);

/* Lexes and parses `source` in one step (used for cluster members and the REPL). */
ASTNode* parse_source(const char* source, LuwError* err);

#endif

#ifndef LUW_AST_H
#define LUW_AST_H

#include "common.h"
#include "token.h"

typedef enum {
    /* Expressions */
    NODE_INT_LIT, NODE_FLOAT_LIT, NODE_STRING_LIT, NODE_BOOL_LIT,
    NODE_VARIABLE, NODE_INTERP, NODE_UNARY, NODE_BINARY,
    NODE_CAPTURE,

    /* Statements */
    NODE_COMMAND, NODE_CLUSTER, NODE_ASSIGN,
    NODE_IF, NODE_WHILE, NODE_FUNC_DECL, NODE_RETURN,
    NODE_DIRECTIVE, NODE_BLOCK, NODE_PROGRAM,
} NodeType;

typedef enum {
    VAR_NAMED,    /* $name ${name} */
    VAR_ENV,      /* $env:NAME */
    VAR_STATUS,   /* $? */
    VAR_ARGC,     /* $# */
    VAR_ARG,      /* $0 .. $9 */
} VarKind;

typedef struct ASTNode ASTNode;
typedef struct { ASTNode** nodes; int count; int capacity; } NodeList;

struct ASTNode {
    NodeType type;
    int      line;
    union {
        int64_t int_literal;                                          /* INT_LIT    */
        double  float_literal;                                        /* FLOAT_LIT  */
        struct { char* value; int length; }          string_literal;  /* STRING_LIT */
        bool    bool_literal;                                         /* BOOL_LIT   */
        struct { VarKind kind; char* name; int index; } variable;     /* VARIABLE   */
        NodeList interp;                                              /* INTERP: parts joined as strings */
        struct { TokenType op; ASTNode* operand; }   unary;           /* UNARY      */
        struct { TokenType op; ASTNode* left; ASTNode* right; } binary; /* BINARY   */
        struct {
            char*     name;
            ShellKind shell;         /* SHELL_NONE unless !pwsh / !cmd */
            NodeList  args;
            char**    flag_names;    /* insertion ordered, names unique */
            ASTNode** flag_values;
            int       flag_count;
            int       flag_capacity;
        } command;                                                    /* COMMAND    */
        struct { char** lines; int count; } cluster;                  /* CLUSTER    */
        struct { char* name; ASTNode* value; }       assign;          /* ASSIGN     */
        struct { ASTNode* cond; ASTNode* then_b; ASTNode* else_b; } if_stmt;  /* IF */
        struct { ASTNode* cond; ASTNode* body; }     while_stmt;      /* WHILE      */
        struct { char* name; ASTNode* body; }        func_decl;       /* FUNC_DECL  */
        char* directive;                                              /* DIRECTIVE: name without '!' */
        ASTNode* child;                                               /* RETURN (nullable), CAPTURE */
        NodeList block;                                               /* BLOCK      */
        NodeList program;                                             /* PROGRAM    */
    } as;
};

ASTNode* ast_new(NodeType type, int line);
void     ast_free(ASTNode* node);
void     nodelist_init(NodeList* list);
void     nodelist_add(NodeList* list, ASTNode* node);
void     nodelist_free(NodeList* list);

/* Sets flag `name` on a command node; a repeated name keeps its slot and takes the new value. */
void     ast_command_set_flag(ASTNode* command, char* name, ASTNode* value);
void     ast_cluster_add(ASTNode* cluster, char* line);

#endif

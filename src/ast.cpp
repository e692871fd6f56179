#include "ast.h"

ASTNode* ast_new(NodeType type, int line) {
    ASTNode* node = (ASTNode*)calloc(1, sizeof(ASTNode));
    node->type = type;
    node->line = line;
    return node;
}

void nodelist_init(NodeList* list) {
    list->nodes = nullptr;
    list->count = 0;
    list->capacity = 0;
}

void nodelist_add(NodeList* list, ASTNode* node) {
    if (list->count >= list->capacity) {
        int cap = list->capacity < 8 ? 8 : list->capacity * 2;
        list->nodes = (ASTNode**)realloc(list->nodes, sizeof(ASTNode*) * cap);
        list->capacity = cap;
    }
    list->nodes[list->count++] = node;
}

void nodelist_free(NodeList* list) {
    free(list->nodes);
    nodelist_init(list);
}

static void nodelist_free_all(NodeList* list) {
    for (int i = 0; i < list->count; i++) ast_free(list->nodes[i]);
    nodelist_free(list);
}

void ast_command_set_flag(ASTNode* cmd, char* name, ASTNode* value) {
    for (int i = 0; i < cmd->as.command.flag_count; i++) {
        if (strcmp(cmd->as.command.flag_names[i], name) == 0) {
            free(name);
            ast_free(cmd->as.command.flag_values[i]);
            cmd->as.command.flag_values[i] = value;
            return;
        }
    }
    if (cmd->as.command.flag_count >= cmd->as.command.flag_capacity) {
        int cap = cmd->as.command.flag_capacity < 4 ? 4 : cmd->as.command.flag_capacity * 2;
        cmd->as.command.flag_names = (char**)realloc(cmd->as.command.flag_names, sizeof(char*) * cap);
        cmd->as.command.flag_values = (ASTNode**)realloc(cmd->as.command.flag_values, sizeof(ASTNode*) * cap);
        cmd->as.command.flag_capacity = cap;
    }
    int i = cmd->as.command.flag_count++;
    cmd->as.command.flag_names[i] = name;
    cmd->as.command.flag_values[i] = value;
}

void ast_cluster_add(ASTNode* cluster, char* line) {
    int n = cluster->as.cluster.count;
    cluster->as.cluster.lines = (char**)realloc(cluster->as.cluster.lines, sizeof(char*) * (n + 1));
    cluster->as.cluster.lines[n] = line;
    cluster->as.cluster.count = n + 1;
}

void ast_free(ASTNode* node) {
    if (!node) return;
    switch (node->type) {
    case NODE_STRING_LIT:
        free(node->as.string_literal.value);
        break;
    case NODE_VARIABLE:
        free(node->as.variable.name);
        break;
    case NODE_INTERP:
        nodelist_free_all(&node->as.interp);
        break;
    case NODE_UNARY:
        ast_free(node->as.unary.operand);
        break;
    case NODE_BINARY:
        ast_free(node->as.binary.left);
        ast_free(node->as.binary.right);
        break;
    case NODE_COMMAND:
        free(node->as.command.name);
        nodelist_free_all(&node->as.command.args);
        for (int i = 0; i < node->as.command.flag_count; i++) {
            free(node->as.command.flag_names[i]);
            ast_free(node->as.command.flag_values[i]);
        }
        free(node->as.command.flag_names);
        free(node->as.command.flag_values);
        break;
    case NODE_CLUSTER:
        for (int i = 0; i < node->as.cluster.count; i++) free(node->as.cluster.lines[i]);
        free(node->as.cluster.lines);
        break;
    case NODE_ASSIGN:
        free(node->as.assign.name);
        ast_free(node->as.assign.value);
        break;
    case NODE_IF:
        ast_free(node->as.if_stmt.cond);
        ast_free(node->as.if_stmt.then_b);
        ast_free(node->as.if_stmt.else_b);
        break;
    case NODE_WHILE:
        ast_free(node->as.while_stmt.cond);
        ast_free(node->as.while_stmt.body);
        break;
    case NODE_FUNC_DECL:
        free(node->as.func_decl.name);
        ast_free(node->as.func_decl.body);
        break;
    case NODE_DIRECTIVE:
        free(node->as.directive);
        break;
    case NODE_RETURN:
    case NODE_CAPTURE:
        ast_free(node->as.child);
        break;
    case NODE_BLOCK:
        nodelist_free_all(&node->as.block);
        break;
    case NODE_PROGRAM:
        nodelist_free_all(&node->as.program);
        break;
    default:
        break;
    }
    free(node);
}

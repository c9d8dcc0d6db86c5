// tests/unit/syntax/test_parser.cpp - Parser structure tests
//
#include <gtest/gtest.h>

#include <string>

#include "cfgc/ast/ast.hpp"
#include "cfgc/basic/casting.hpp"
#include "cfgc/test_support/parse_helpers.hpp"

using namespace cfgc;
using cfgc::test_support::parse;

namespace
{

std::string spelled(TokenSpan toks)
{
  std::string out;
  for (const auto & t : toks) {
    if (!out.empty()) {
      out += ' ';
    }
    out += std::string(t.text);
  }
  return out;
}

void dump_diags(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    ADD_FAILURE() << "unexpected diagnostic: " << d.message;
  }
}

}  // namespace

TEST(SyntaxParser, GlobalsAndFunctions)
{
  auto unit = parse(
    "int g, buf[16];\n"
    "float f;\n"
    "int add(int a, int b) { return a + b; }\n"
    "void main() { }\n");
  dump_diags(unit.diags);
  ASSERT_NE(unit.unit, nullptr);

  ASSERT_EQ(unit.unit->globals.size(), 2U);
  const VarDecl * g = unit.unit->globals[0];
  EXPECT_EQ(g->type_name, "int");
  ASSERT_EQ(g->declarators.size(), 2U);
  EXPECT_EQ(g->declarators[0]->name, "g");
  EXPECT_FALSE(g->declarators[0]->array_size.has_value());
  EXPECT_EQ(g->declarators[1]->name, "buf");
  ASSERT_TRUE(g->declarators[1]->array_size.has_value());
  EXPECT_EQ(*g->declarators[1]->array_size, 16);
  EXPECT_EQ(spelled(g->get_tokens()), "int g , buf [ 16 ] ;");

  ASSERT_EQ(unit.unit->functions.size(), 2U);
  const FunctionDecl * add = unit.unit->functions[0];
  EXPECT_EQ(add->name, "add");
  EXPECT_EQ(add->return_type, "int");
  ASSERT_EQ(add->params.size(), 2U);
  EXPECT_EQ(add->params[1]->name, "b");
  EXPECT_EQ(spelled(add->param_tokens), "int a , int b");

  const FunctionDecl * main_fn = unit.unit->functions[1];
  EXPECT_EQ(main_fn->return_type, "void");
  EXPECT_TRUE(main_fn->params.empty());
  EXPECT_TRUE(main_fn->param_tokens.empty());
  ASSERT_NE(main_fn->body, nullptr);
  EXPECT_TRUE(main_fn->body->stmts.empty());
}

TEST(SyntaxParser, ArrayParameter)
{
  auto unit = parse("int sum(int xs[], int n) { return 0; }");
  dump_diags(unit.diags);
  const FunctionDecl * fn = unit.unit->functions[0];
  ASSERT_EQ(fn->params.size(), 2U);
  EXPECT_TRUE(fn->params[0]->is_array);
  EXPECT_FALSE(fn->params[1]->is_array);
  EXPECT_EQ(spelled(fn->param_tokens), "int xs [ ] , int n");
}

TEST(SyntaxParser, StatementKinds)
{
  auto unit = parse(
    "int main() {\n"
    "  int i;\n"
    "  i = 0;\n"
    "  print(i, 2);\n"
    "  ;\n"
    "  { i = 1; }\n"
    "  if (i) i = 2; else i = 3;\n"
    "  while (i < 10) i = i + 1;\n"
    "  for (i = 0; i < 3; i = i + 1) ;\n"
    "  return;\n"
    "}\n");
  dump_diags(unit.diags);

  const CompoundStmt * body = unit.unit->functions[0]->body;
  ASSERT_EQ(body->decls.size(), 1U);
  ASSERT_EQ(body->stmts.size(), 8U);
  EXPECT_TRUE(isa<AssignStmt>(body->stmts[0]));
  EXPECT_TRUE(isa<CallStmt>(body->stmts[1]));
  EXPECT_TRUE(isa<EmptyStmt>(body->stmts[2]));
  EXPECT_TRUE(isa<CompoundStmt>(body->stmts[3]));
  EXPECT_TRUE(isa<IfStmt>(body->stmts[4]));
  EXPECT_TRUE(isa<WhileStmt>(body->stmts[5]));
  EXPECT_TRUE(isa<ForStmt>(body->stmts[6]));
  EXPECT_TRUE(isa<ReturnStmt>(body->stmts[7]));

  const auto * call = cast<CallStmt>(body->stmts[1]);
  EXPECT_EQ(call->call->callee, "print");
  EXPECT_EQ(call->call->args.size(), 2U);
  EXPECT_EQ(spelled(call->get_tokens()), "print ( i , 2 ) ;");

  EXPECT_EQ(cast<ReturnStmt>(body->stmts[7])->value, nullptr);
}

TEST(SyntaxParser, AssignmentTokenSpans)
{
  auto unit = parse(
    "int main() {\n"
    "  a[i + 1] = b * 2;\n"
    "  for (i = 0; i < n; i = i + 1) x = i;\n"
    "  return 0;\n"
    "}\n");
  dump_diags(unit.diags);

  const CompoundStmt * body = unit.unit->functions[0]->body;
  const auto * assign = cast<AssignStmt>(body->stmts[0]);
  EXPECT_EQ(assign->target, "a");
  ASSERT_NE(assign->index, nullptr);
  EXPECT_EQ(spelled(assign->get_tokens()), "a [ i + 1 ] = b * 2 ;");

  // For clauses stop before their ';'.
  const auto * loop = cast<ForStmt>(body->stmts[1]);
  EXPECT_EQ(spelled(loop->init->get_tokens()), "i = 0");
  EXPECT_EQ(spelled(loop->condition->get_tokens()), "i < n");
  EXPECT_EQ(spelled(loop->update->get_tokens()), "i = i + 1");
  EXPECT_EQ(spelled(loop->body->get_tokens()), "x = i ;");
}

TEST(SyntaxParser, BinaryPrecedenceAndAssociativity)
{
  auto unit = parse("int main() { x = a + b * c - d; y = !a && b || c == d < e; return 0; }");
  dump_diags(unit.diags);
  const CompoundStmt * body = unit.unit->functions[0]->body;

  // (a + (b * c)) - d
  const auto * sub = dyn_cast<BinaryExpr>(cast<AssignStmt>(body->stmts[0])->value);
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(sub->op, BinaryOp::Sub);
  const auto * add = dyn_cast<BinaryExpr>(sub->lhs);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);
  const auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);

  // ((!a) && b) || (c == (d < e))
  const auto * lor = dyn_cast<BinaryExpr>(cast<AssignStmt>(body->stmts[1])->value);
  ASSERT_NE(lor, nullptr);
  EXPECT_EQ(lor->op, BinaryOp::Or);
  const auto * land = dyn_cast<BinaryExpr>(lor->lhs);
  ASSERT_NE(land, nullptr);
  EXPECT_EQ(land->op, BinaryOp::And);
  EXPECT_TRUE(isa<UnaryExpr>(land->lhs));
  const auto * eq = dyn_cast<BinaryExpr>(lor->rhs);
  ASSERT_NE(eq, nullptr);
  EXPECT_EQ(eq->op, BinaryOp::Eq);
  const auto * lt = dyn_cast<BinaryExpr>(eq->rhs);
  ASSERT_NE(lt, nullptr);
  EXPECT_EQ(lt->op, BinaryOp::Lt);
}

TEST(SyntaxParser, ParenthesesStayInTokenSpan)
{
  auto unit = parse("int main() { if ((a + b) * c) x = 1; return 0; }");
  dump_diags(unit.diags);
  const auto * stmt = cast<IfStmt>(unit.unit->functions[0]->body->stmts[0]);
  EXPECT_EQ(spelled(stmt->condition->get_tokens()), "( a + b ) * c");

  const auto * mul = dyn_cast<BinaryExpr>(stmt->condition);
  ASSERT_NE(mul, nullptr);
  EXPECT_TRUE(isa<ParenExpr>(mul->lhs));
}

TEST(SyntaxParser, IndexCallAndLiterals)
{
  auto unit = parse("int main() { x = f(a[2], 3.5, -1); return 0; }");
  dump_diags(unit.diags);
  const auto * assign = cast<AssignStmt>(unit.unit->functions[0]->body->stmts[0]);
  const auto * call = dyn_cast<CallExpr>(assign->value);
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->args.size(), 3U);
  EXPECT_TRUE(isa<IndexExpr>(call->args[0]));
  const auto * flt = dyn_cast<FloatLiteral>(call->args[1]);
  ASSERT_NE(flt, nullptr);
  EXPECT_DOUBLE_EQ(flt->value, 3.5);
  const auto * neg = dyn_cast<UnaryExpr>(call->args[2]);
  ASSERT_NE(neg, nullptr);
  EXPECT_EQ(neg->op, UnaryOp::Neg);
  const auto * one = dyn_cast<IntLiteral>(neg->operand);
  ASSERT_NE(one, nullptr);
  EXPECT_EQ(one->value, 1);
}

TEST(SyntaxParser, DanglingElseBindsToInnermostIf)
{
  auto unit = parse("int main() { if (a) if (b) x = 1; else x = 2; return 0; }");
  dump_diags(unit.diags);
  const auto * outer = cast<IfStmt>(unit.unit->functions[0]->body->stmts[0]);
  EXPECT_EQ(outer->else_stmt, nullptr);
  const auto * inner = dyn_cast<IfStmt>(outer->then_stmt);
  ASSERT_NE(inner, nullptr);
  EXPECT_NE(inner->else_stmt, nullptr);
}

TEST(SyntaxParser, CommentsAreIgnored)
{
  auto unit = parse(
    "// leading\n"
    "int main() {\n"
    "  /* block */ x = 1; // trailing\n"
    "  return 0;\n"
    "}\n");
  dump_diags(unit.diags);
  const auto * assign = cast<AssignStmt>(unit.unit->functions[0]->body->stmts[0]);
  EXPECT_EQ(spelled(assign->get_tokens()), "x = 1 ;");
}

TEST(SyntaxParser, RangesMapToSource)
{
  auto unit = parse("int main() {\n  return 42;\n}\n");
  dump_diags(unit.diags);
  const Stmt * ret = unit.unit->functions[0]->body->stmts[0];
  EXPECT_EQ(unit.slice(ret->get_range()), "return 42;");
  const auto full = unit.full_range(ret->get_range());
  EXPECT_EQ(full.start_line, 2U);
  EXPECT_EQ(full.start_column, 3U);
}

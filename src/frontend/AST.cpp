//===----------------------------------------------------------------------===//
//
// Part of the pgs project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers shared by the AST nodes.
//
//===----------------------------------------------------------------------===//

#include "frontend/AST.hpp"

namespace pgs::frontend
{

std::string joinPath(const std::vector<std::string> &path)
{
    std::string out;
    for (size_t i = 0; i < path.size(); ++i)
    {
        if (i)
            out += "::";
        out += path[i];
    }
    return out;
}

std::string TypeNode::spelling() const
{
    return joinPath(path);
}

std::string IdentExpr::spelling() const
{
    return joinPath(path);
}

std::string ImportDecl::target() const
{
    return joinPath(path);
}

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
    }
    return "?";
}

} // namespace pgs::frontend

// weave

#include "weave/expression_compiler.hh"

#include "weave/alloc.hh"
#include "weave/log.hh"

#include "array.hh"
#include "assert.hh"
#include "index.hh"
#include "kernels.hh"
#include "utility.hh"

#include <spdlog/spdlog.h>

#include <new>
#include <string_view>

namespace {
    constexpr bool isAsciiDigit(char c) noexcept { return c >= '0' && c <= '9'; }
    constexpr bool isAsciiLetter(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
    constexpr bool isAsciiSpace(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

    constexpr bool isIdentifierFirst(char c) noexcept { return c == '_' || isAsciiLetter(c); }
    constexpr bool isIdentifierRest(char c) noexcept { return c == '_' || isAsciiLetter(c) || isAsciiDigit(c); }

    constexpr bool strEqual(char const* keyword, char const* start, uint32_t length) noexcept
    {
        for (uint32_t index = 0; index != length; ++index)
        {
            if (keyword[index] == '\0' || keyword[index] != start[index])
                return false;
        }
        return keyword[length] == '\0';
    }
} // namespace

namespace weave {
    namespace {
        class ExpressionCompiler final : public wvExpressionCompiler
        {
        public:
            explicit ExpressionCompiler(wvAllocator& alloc) noexcept
                : allocator_(alloc), tokens_(alloc), ast_(alloc), astLinks_(alloc), expression_(alloc)
            {
            }

            void reset() override;
            bool compile(char const* expression, char const* expressionEnd = nullptr) override;
            bool optimize() override;
            wvExprId build(wvLowerContext& context, wvExpressionHost& host) override;

            bool isEmpty() const noexcept override;
            bool isConstant() const noexcept override;
            bool asConstant(float& out_value) const noexcept override;

            uint32_t errorOffset() const noexcept override { return errorOffset_; }

            wvAllocator& allocator() noexcept { return allocator_; }

        private:
            WV_DEFINE_INDEX(TokenIndex);
            WV_DEFINE_INDEX(AstIndex);
            WV_DEFINE_INDEX(AstLinkIndex);
            WV_DEFINE_INDEX(SourceLocation);

            enum class TokenType : uint8_t
            {
                Invalid,

                Plus,
                Minus,
                Star,
                Slash,
                Less,
                Greater,
                LParen,
                RParen,
                Comma,
                Number,
                Identifier,
                KeyTrue,
                KeyFalse,
                KeyOr,
                KeyAnd,
                KeyNot,
                KeyXor,
                Reserved,
            };

            enum class AstType : uint8_t
            {
                Invalid,

                // common ast types
                BinaryOp,
                UnaryOp,
                Identifier,

                // only exist before resolving
                Literal,
                Call,
                Group,

                // only exist after resolving
                Constant,
                Function,
            };

            enum class Operator : uint8_t
            {
                Invalid,

                // binary arithmetic
                Add,
                Sub,
                Mul,
                Div,

                // binary comparison
                Less,
                Greater,

                // binary logical
                And,
                Or,
                Xor,

                // unary arithmetic
                Negate,

                // unary logical
                Not,

                // special
                Group,
                Call,
            };

            struct Token
            {
                SourceLocation offset = wvInvalidIndex;
                uint16_t length = 0;
                TokenType type = TokenType::Invalid;
                float number = 0.f;
            };

            struct Ast
            {
                AstType type = AstType::Invalid;
                TokenIndex primaryTokenIndex = wvInvalidIndex;
                union Data {
                    int unused_ = 0;
                    float constant;
                    struct Binary
                    {
                        Operator op = Operator::Invalid;
                        AstIndex leftIndex = wvInvalidIndex;
                        AstIndex rightIndex = wvInvalidIndex;
                    } binary;
                    struct Unary
                    {
                        Operator op = Operator::Invalid;
                        AstIndex childIndex = wvInvalidIndex;
                    } unary;
                    struct Group
                    {
                        AstIndex childIndex = wvInvalidIndex;
                    } group;
                    struct Call
                    {
                        AstIndex targetIndex = wvInvalidIndex;
                        AstLinkIndex firstArgIndex = wvInvalidIndex;
                    } call;
                    struct Function
                    {
                        wvOpCode op = wvOpCode::Nop;
                        AstLinkIndex firstArgIndex = wvInvalidIndex;
                        uint8_t arity = 0;
                    } function;
                } data;
            };

            struct AstLink
            {
                AstIndex childIndex = wvInvalidIndex;
                AstLinkIndex nextIndex = wvInvalidIndex;
            };

            struct Precedence
            {
                Operator op = Operator::Invalid;
                int power = -1;
            };

            enum class Status
            {
                Reset,
                Lexed,
                Parsed,
                Resolved,
                Optimized,
            };

            bool tokenize();
            AstIndex parse();
            AstIndex resolve(AstIndex astIndex);
            AstIndex optimize(AstIndex astIndex);
            wvExprId generate(AstIndex astIndex, wvLowerContext& context, wvExpressionHost& host) const;

            static Precedence unaryPrecedence(TokenType token) noexcept;
            static Precedence binaryPrecedence(TokenType token) noexcept;
            static wvOpCode operatorOpCode(Operator op) noexcept;
            AstIndex parseExpr(int bindingPower);
            AstIndex parseFunc(AstIndex targetIndex);

            AstIndex fail(TokenIndex tokenIndex);
            AstIndex makeConstant(AstIndex astIndex, float value);

            wvAllocator& allocator_;
            wvArray<Token, TokenIndex> tokens_;
            wvArray<Ast, AstIndex> ast_;
            wvArray<AstLink, AstLinkIndex> astLinks_;
            wvArray<char> expression_;
            TokenIndex nextToken_ = wvInvalidIndex;
            AstIndex astRoot_ = wvInvalidIndex;
            uint32_t errorOffset_ = 0;
            Status status_ = Status::Reset;
        };

        struct FunctionInfo
        {
            char const* name = nullptr;
            wvOpCode op = wvOpCode::Nop;
            uint8_t arity = 0;
        };

        constexpr FunctionInfo functions[] = {
            {.name = "sin", .op = wvOpCode::Sin, .arity = 1},
            {.name = "cos", .op = wvOpCode::Cos, .arity = 1},
            {.name = "abs", .op = wvOpCode::Abs, .arity = 1},
            {.name = "floor", .op = wvOpCode::Floor, .arity = 1},
            {.name = "fract", .op = wvOpCode::Fract, .arity = 1},
            {.name = "sqrt", .op = wvOpCode::Sqrt, .arity = 1},
            {.name = "min", .op = wvOpCode::Min, .arity = 2},
            {.name = "max", .op = wvOpCode::Max, .arity = 2},
            {.name = "pow", .op = wvOpCode::Pow, .arity = 2},
            {.name = "mod", .op = wvOpCode::Mod, .arity = 2},
            {.name = "clamp", .op = wvOpCode::Clamp, .arity = 3},
            {.name = "mix", .op = wvOpCode::Mix, .arity = 3},
            {.name = "select", .op = wvOpCode::Select, .arity = 3},
        };
    } // namespace

    wvExpressionCompiler* wvCreateExpressionCompiler(wvAllocator& alloc)
    {
        return new (alloc.allocate(sizeof(ExpressionCompiler), alignof(ExpressionCompiler))) ExpressionCompiler(alloc);
    }

    void wvDestroyExpressionCompiler(wvExpressionCompiler* compiler)
    {
        if (compiler != nullptr)
        {
            ExpressionCompiler* impl = static_cast<ExpressionCompiler*>(compiler);
            wvAllocator& alloc = impl->allocator();
            impl->~ExpressionCompiler();
            alloc.free(impl, sizeof(ExpressionCompiler), alignof(ExpressionCompiler));
        }
    }

    void ExpressionCompiler::reset()
    {
        tokens_.clear();
        ast_.clear();
        astLinks_.clear();
        expression_.clear();
        nextToken_ = wvInvalidIndex;
        astRoot_ = wvInvalidIndex;
        errorOffset_ = 0;
        status_ = Status::Reset;
    }

    bool ExpressionCompiler::compile(char const* expression, char const* expressionEnd)
    {
        WV_GUARD_OR(expression != nullptr, false);

        reset();

        expression_.assign(expression, wvNameLen(wvName{expression, expressionEnd}));

        if (!tokenize())
            return false;

        if (!tokens_.empty())
        {
            astRoot_ = parse();
            if (astRoot_ == wvInvalidIndex)
                return false;

            astRoot_ = resolve(astRoot_);
            if (astRoot_ == wvInvalidIndex)
                return false;
        }

        status_ = Status::Resolved;
        return true;
    }

    bool ExpressionCompiler::optimize()
    {
        WV_GUARD_OR(status_ == Status::Resolved, false);

        if (astRoot_ == wvInvalidIndex)
            return true;

        AstIndex const optimizedAstIndex = optimize(astRoot_);
        if (optimizedAstIndex == wvInvalidIndex)
            return false;

        astRoot_ = optimizedAstIndex;
        status_ = Status::Optimized;
        return true;
    }

    wvExprId ExpressionCompiler::build(wvLowerContext& context, wvExpressionHost& host)
    {
        WV_GUARD_OR(status_ == Status::Resolved || status_ == Status::Optimized, wvInvalidExprId);

        if (astRoot_ == wvInvalidIndex)
            return wvInvalidExprId;

        return generate(astRoot_, context, host);
    }

    auto ExpressionCompiler::fail(TokenIndex tokenIndex) -> AstIndex
    {
        if (tokens_.contains(tokenIndex))
            errorOffset_ = tokens_[tokenIndex].offset.value();
        else
            errorOffset_ = expression_.size();
        return wvInvalidIndex;
    }

    bool ExpressionCompiler::tokenize()
    {
        WV_GUARD_OR(status_ == Status::Reset, false);
        status_ = Status::Lexed;

        constexpr struct TokenMap
        {
            char match;
            TokenType type;
        } tokenMap[] = {
            {.match = '+', .type = TokenType::Plus},
            {.match = '-', .type = TokenType::Minus},
            {.match = '*', .type = TokenType::Star},
            {.match = '/', .type = TokenType::Slash},
            {.match = '<', .type = TokenType::Less},
            {.match = '>', .type = TokenType::Greater},
            {.match = '(', .type = TokenType::LParen},
            {.match = ')', .type = TokenType::RParen},
            {.match = ',', .type = TokenType::Comma},
        };

        constexpr struct KeywordMap
        {
            char const* keyword;
            TokenType type;
        } keywordMap[] = {
            {.keyword = "true", .type = TokenType::KeyTrue},
            {.keyword = "false", .type = TokenType::KeyFalse},
            {.keyword = "and", .type = TokenType::KeyAnd},
            {.keyword = "or", .type = TokenType::KeyOr},
            {.keyword = "xor", .type = TokenType::KeyXor},
            {.keyword = "not", .type = TokenType::KeyNot},

            // reserved words we'd like to consider using in the future
            {.keyword = "if", .type = TokenType::Reserved},
            {.keyword = "then", .type = TokenType::Reserved},
            {.keyword = "else", .type = TokenType::Reserved},
            {.keyword = "let", .type = TokenType::Reserved},
            {.keyword = "in", .type = TokenType::Reserved},
        };

        char const* const inputStart = expression_.data();
        char const* const inputEnd = inputStart + expression_.size();
        char const* input = inputStart;
        while (input != inputEnd)
        {
            // skip spaces
            if (isAsciiSpace(*input))
            {
                ++input;
                continue;
            }

            SourceLocation const offset{static_cast<uint32_t>(input - inputStart)};

            // handle operations
            {
                bool matched = false;
                for (TokenMap const& item : tokenMap)
                {
                    if (item.match == *input)
                    {
                        tokens_.pushBack(Token{.offset = offset, .length = 1, .type = item.type});
                        ++input;
                        matched = true;
                        break;
                    }
                }
                if (matched)
                    continue;
            }

            // handle identifiers / keywords
            if (isIdentifierFirst(*input))
            {
                ++input;
                while (input != inputEnd && isIdentifierRest(*input))
                    ++input;

                uint32_t const end = static_cast<uint32_t>(input - inputStart);

                TokenType type = TokenType::Identifier;

                for (KeywordMap const& keyword : keywordMap)
                {
                    if (strEqual(keyword.keyword, inputStart + offset.value(), end - offset.value()))
                    {
                        type = keyword.type;
                        break;
                    }
                }

                if (type == TokenType::Reserved)
                {
                    errorOffset_ = offset.value();
                    return false;
                }

                tokens_.pushBack(Token{.offset = offset, .length = static_cast<uint16_t>(end - offset.value()), .type = type});
                continue;
            }

            // handle integer and decimal numbers
            if (isAsciiDigit(*input) || (*input == '.' && input + 1 != inputEnd && isAsciiDigit(input[1])))
            {
                double value = 0.0;
                while (input != inputEnd && isAsciiDigit(*input))
                {
                    value = value * 10.0 + (*input - '0');
                    ++input;
                }

                if (input != inputEnd && *input == '.')
                {
                    ++input;
                    double scale = 0.1;
                    while (input != inputEnd && isAsciiDigit(*input))
                    {
                        value += (*input - '0') * scale;
                        scale *= 0.1;
                        ++input;
                    }
                }

                // a number running into an identifier is malformed
                if (input != inputEnd && isIdentifierFirst(*input))
                {
                    errorOffset_ = static_cast<uint32_t>(input - inputStart);
                    return false;
                }

                uint32_t const end = static_cast<uint32_t>(input - inputStart);
                tokens_.pushBack(Token{.offset = offset,
                    .length = static_cast<uint16_t>(end - offset.value()),
                    .type = TokenType::Number,
                    .number = static_cast<float>(value)});
                continue;
            }

            errorOffset_ = offset.value();
            return false;
        }

        return true;
    }

    // returns wvInvalidIndex on failure
    auto ExpressionCompiler::parse() -> AstIndex
    {
        WV_GUARD_OR(status_ == Status::Lexed, wvInvalidIndex);
        status_ = Status::Parsed;
        nextToken_ = TokenIndex{0};

        AstIndex const root = parseExpr(0);
        if (root == wvInvalidIndex)
            return wvInvalidIndex;

        // unconsumed trailing tokens
        if (tokens_.contains(nextToken_))
            return fail(nextToken_);

        return root;
    }

    auto ExpressionCompiler::unaryPrecedence(TokenType token) noexcept -> Precedence
    {
        switch (token)
        {
        case TokenType::Minus: return {.op = Operator::Negate, .power = 6};
        case TokenType::KeyNot: return {.op = Operator::Not, .power = 6};
        case TokenType::LParen: return {.op = Operator::Group, .power = 0};
        default: return {};
        }
    }

    auto ExpressionCompiler::binaryPrecedence(TokenType token) noexcept -> Precedence
    {
        switch (token)
        {
        case TokenType::KeyOr: return {.op = Operator::Or, .power = 1};
        case TokenType::KeyXor: return {.op = Operator::Xor, .power = 1};
        case TokenType::KeyAnd: return {.op = Operator::And, .power = 2};
        case TokenType::Less: return {.op = Operator::Less, .power = 3};
        case TokenType::Greater: return {.op = Operator::Greater, .power = 3};
        case TokenType::Plus: return {.op = Operator::Add, .power = 4};
        case TokenType::Minus: return {.op = Operator::Sub, .power = 4};
        case TokenType::Star: return {.op = Operator::Mul, .power = 5};
        case TokenType::Slash: return {.op = Operator::Div, .power = 5};
        case TokenType::LParen: return {.op = Operator::Call, .power = 7};
        default: return {};
        }
    }

    wvOpCode ExpressionCompiler::operatorOpCode(Operator op) noexcept
    {
        switch (op)
        {
        case Operator::Add: return wvOpCode::Add;
        case Operator::Sub: return wvOpCode::Sub;
        case Operator::Mul: return wvOpCode::Mul;
        case Operator::Div: return wvOpCode::Div;
        case Operator::Less: return wvOpCode::Less;
        case Operator::Greater: return wvOpCode::Greater;
        case Operator::And: return wvOpCode::And;
        case Operator::Or: return wvOpCode::Or;
        case Operator::Xor: return wvOpCode::Xor;
        case Operator::Negate: return wvOpCode::Neg;
        case Operator::Not: return wvOpCode::Not;
        default: return wvOpCode::Nop;
        }
    }

    auto ExpressionCompiler::parseExpr(int power) -> AstIndex
    {
        if (!tokens_.contains(nextToken_))
            return fail(nextToken_);

        // parse unary or atom
        Token const& leftToken = tokens_[nextToken_];
        AstIndex leftIndex = wvInvalidIndex;
        switch (leftToken.type)
        {
        case TokenType::Number:
        case TokenType::KeyTrue:
        case TokenType::KeyFalse:
            leftIndex = AstIndex{ast_.size()};
            ast_.pushBack(Ast{.type = AstType::Literal, .primaryTokenIndex = nextToken_});
            ++nextToken_;
            break;
        case TokenType::Identifier:
            leftIndex = AstIndex{ast_.size()};
            ast_.pushBack(Ast{.type = AstType::Identifier, .primaryTokenIndex = nextToken_});
            ++nextToken_;
            break;
        default: {
            Precedence const prec = unaryPrecedence(leftToken.type);
            if (prec.power == -1)
                return fail(nextToken_);

            TokenIndex const leftTokenIndex = nextToken_;
            ++nextToken_;

            AstIndex rightIndex = parseExpr(prec.power);
            if (rightIndex == wvInvalidIndex)
                return wvInvalidIndex;

            if (prec.op == Operator::Group)
            {
                if (!tokens_.contains(nextToken_) || tokens_[nextToken_].type != TokenType::RParen)
                    return fail(nextToken_);
                ++nextToken_;

                leftIndex = AstIndex{ast_.size()};
                ast_.pushBack(
                    Ast{.type = AstType::Group, .primaryTokenIndex = leftTokenIndex, .data = {.group = {.childIndex = rightIndex}}});
            }
            else
            {
                leftIndex = AstIndex{ast_.size()};
                ast_.pushBack(Ast{.type = AstType::UnaryOp,
                    .primaryTokenIndex = leftTokenIndex,
                    .data = {.unary = {.op = prec.op, .childIndex = rightIndex}}});
            }
            break;
        }
        }

        while (tokens_.contains(nextToken_))
        {
            // expect an infix operator
            TokenIndex const infixTokenIndex = nextToken_;
            Token const& infixToken = tokens_[infixTokenIndex];

            Precedence const prec = binaryPrecedence(infixToken.type);
            if (prec.power == -1)
                break;

            if (prec.power <= power)
                break;

            ++nextToken_;

            if (prec.op == Operator::Call)
            {
                leftIndex = parseFunc(leftIndex);
                if (leftIndex == wvInvalidIndex)
                    return wvInvalidIndex;
            }
            else
            {
                AstIndex const rightIndex = parseExpr(prec.power);
                if (rightIndex == wvInvalidIndex)
                    return wvInvalidIndex;

                AstIndex const newIndex{ast_.size()};
                ast_.pushBack(Ast{.type = AstType::BinaryOp,
                    .primaryTokenIndex = infixTokenIndex,
                    .data = {.binary = {.op = prec.op, .leftIndex = leftIndex, .rightIndex = rightIndex}}});
                leftIndex = newIndex;
            }
        }

        return leftIndex;
    }

    auto ExpressionCompiler::parseFunc(AstIndex targetIndex) -> AstIndex
    {
        AstIndex const callIndex{ast_.size()};
        ast_.pushBack(Ast{.type = AstType::Call, .primaryTokenIndex = nextToken_, .data = {.call = {.targetIndex = targetIndex}}});

        if (tokens_.contains(nextToken_) && tokens_[nextToken_].type == TokenType::RParen)
        {
            ++nextToken_;
            return callIndex;
        }

        AstLinkIndex prevLinkIndex = wvInvalidIndex;
        while (tokens_.contains(nextToken_))
        {
            AstIndex const argIndex = parseExpr(0);
            if (argIndex == wvInvalidIndex)
                return wvInvalidIndex;

            AstLinkIndex const linkIndex{astLinks_.size()};
            astLinks_.pushBack(AstLink{.childIndex = argIndex});

            if (prevLinkIndex == wvInvalidIndex)
                ast_[callIndex].data.call.firstArgIndex = linkIndex;
            else
                astLinks_[prevLinkIndex].nextIndex = linkIndex;
            prevLinkIndex = linkIndex;

            // we only continue looping if we get a comma
            if (tokens_.contains(nextToken_) && tokens_[nextToken_].type == TokenType::Comma)
            {
                ++nextToken_;
                continue;
            }

            break;
        }

        // expect a closing rparen
        if (!tokens_.contains(nextToken_) || tokens_[nextToken_].type != TokenType::RParen)
            return fail(nextToken_);
        ++nextToken_;

        return callIndex;
    }

    auto ExpressionCompiler::makeConstant(AstIndex astIndex, float value) -> AstIndex
    {
        Ast& ast = ast_[astIndex];
        ast.type = AstType::Constant;
        ast.data = {.constant = value};
        return astIndex;
    }

    // literals become constants, calls are bound to their operator, groups disappear
    auto ExpressionCompiler::resolve(AstIndex astIndex) -> AstIndex
    {
        WV_GUARD_OR(status_ == Status::Parsed, wvInvalidIndex);
        WV_GUARD_OR(astIndex != wvInvalidIndex, wvInvalidIndex);

        switch (ast_[astIndex].type)
        {
        case AstType::Literal: {
            Token const& token = tokens_[ast_[astIndex].primaryTokenIndex];
            switch (token.type)
            {
            case TokenType::KeyTrue: return makeConstant(astIndex, 1.f);
            case TokenType::KeyFalse: return makeConstant(astIndex, 0.f);
            case TokenType::Number: return makeConstant(astIndex, token.number);
            default: WV_GUARD_OR(false, wvInvalidIndex, "Unknown literal token type");
            }
        }
        case AstType::Identifier: return astIndex;
        case AstType::UnaryOp: {
            AstIndex const operandIndex = resolve(ast_[astIndex].data.unary.childIndex);
            if (operandIndex == wvInvalidIndex)
                return wvInvalidIndex;
            ast_[astIndex].data.unary.childIndex = operandIndex;
            return astIndex;
        }
        case AstType::BinaryOp: {
            AstIndex const leftIndex = resolve(ast_[astIndex].data.binary.leftIndex);
            AstIndex const rightIndex = resolve(ast_[astIndex].data.binary.rightIndex);
            if (leftIndex == wvInvalidIndex || rightIndex == wvInvalidIndex)
                return wvInvalidIndex;
            ast_[astIndex].data.binary.leftIndex = leftIndex;
            ast_[astIndex].data.binary.rightIndex = rightIndex;
            return astIndex;
        }
        case AstType::Group: return resolve(ast_[astIndex].data.group.childIndex);
        case AstType::Call: {
            Ast const& target = ast_[ast_[astIndex].data.call.targetIndex];
            if (target.type != AstType::Identifier)
                return fail(ast_[astIndex].primaryTokenIndex);

            Token const& identToken = tokens_[target.primaryTokenIndex];
            char const* const identStart = expression_.data() + identToken.offset.value();

            FunctionInfo const* info = nullptr;
            for (FunctionInfo const& function : functions)
            {
                if (strEqual(function.name, identStart, identToken.length))
                {
                    info = &function;
                    break;
                }
            }
            if (info == nullptr)
                return fail(target.primaryTokenIndex);

            AstLinkIndex const firstArgIndex = ast_[astIndex].data.call.firstArgIndex;
            uint8_t arity = 0;
            for (AstLinkIndex linkIndex = firstArgIndex; linkIndex != wvInvalidIndex; linkIndex = astLinks_[linkIndex].nextIndex)
            {
                AstIndex const argIndex = resolve(astLinks_[linkIndex].childIndex);
                if (argIndex == wvInvalidIndex)
                    return wvInvalidIndex;
                astLinks_[linkIndex].childIndex = argIndex;
                ++arity;
            }

            if (arity != info->arity)
                return fail(target.primaryTokenIndex);

            Ast& ast = ast_[astIndex];
            ast.type = AstType::Function;
            ast.data = {.function = {.op = info->op, .firstArgIndex = firstArgIndex, .arity = arity}};
            return astIndex;
        }
        default: WV_GUARD_OR(false, wvInvalidIndex, "Unknown ast node type");
        }
    }

    // folds every operator whose operands are all constant
    auto ExpressionCompiler::optimize(AstIndex astIndex) -> AstIndex
    {
        switch (ast_[astIndex].type)
        {
        case AstType::UnaryOp: {
            AstIndex const childIndex = optimize(ast_[astIndex].data.unary.childIndex);
            ast_[astIndex].data.unary.childIndex = childIndex;

            if (ast_[childIndex].type == AstType::Constant)
                return makeConstant(astIndex, wvApplyOp(operatorOpCode(ast_[astIndex].data.unary.op), ast_[childIndex].data.constant));
            break;
        }
        case AstType::BinaryOp: {
            AstIndex const leftChildIndex = optimize(ast_[astIndex].data.binary.leftIndex);
            AstIndex const rightChildIndex = optimize(ast_[astIndex].data.binary.rightIndex);
            ast_[astIndex].data.binary.leftIndex = leftChildIndex;
            ast_[astIndex].data.binary.rightIndex = rightChildIndex;

            if (ast_[leftChildIndex].type == AstType::Constant && ast_[rightChildIndex].type == AstType::Constant)
            {
                float const value = wvApplyOp(operatorOpCode(ast_[astIndex].data.binary.op), ast_[leftChildIndex].data.constant,
                    ast_[rightChildIndex].data.constant);
                return makeConstant(astIndex, value);
            }
            break;
        }
        case AstType::Function: {
            float args[3] = {};
            uint32_t arg = 0;
            bool constant = true;

            for (AstLinkIndex linkIndex = ast_[astIndex].data.function.firstArgIndex; linkIndex != wvInvalidIndex;
                 linkIndex = astLinks_[linkIndex].nextIndex)
            {
                AstIndex const newArgIndex = optimize(astLinks_[linkIndex].childIndex);
                astLinks_[linkIndex].childIndex = newArgIndex;

                if (ast_[newArgIndex].type == AstType::Constant && arg < 3)
                    args[arg] = ast_[newArgIndex].data.constant;
                else
                    constant = false;
                ++arg;
            }

            if (constant)
                return makeConstant(astIndex, wvApplyOp(ast_[astIndex].data.function.op, args[0], args[1], args[2]));
            break;
        }
        default: break;
        }

        // no optimization was performed, so we return our original node
        return astIndex;
    }

    wvExprId ExpressionCompiler::generate(AstIndex astIndex, wvLowerContext& context, wvExpressionHost& host) const
    {
        Ast const& ast = ast_[astIndex];
        switch (ast.type)
        {
        case AstType::Constant: return context.constant(ast.data.constant);
        case AstType::Identifier: {
            Token const& identToken = tokens_[ast.primaryTokenIndex];
            char const* const identStart = expression_.data() + identToken.offset.value();
            char const* const identEnd = identStart + identToken.length;

            wvExprId const result = host.lookupIdentifier(wvName{identStart, identEnd}, context);
            if (result == wvInvalidExprId)
            {
                SPDLOG_LOGGER_DEBUG(wvLog(), "expression: unknown identifier '{}'", std::string_view(identStart, identToken.length));
                context.error(wvCompileErrorCode::ExpressionCompileError, "unknown identifier", identToken.offset.value());
            }
            return result;
        }
        case AstType::BinaryOp: {
            wvExprId const left = generate(ast.data.binary.leftIndex, context, host);
            wvExprId const right = generate(ast.data.binary.rightIndex, context, host);
            return context.kernel(operatorOpCode(ast.data.binary.op), left, right);
        }
        case AstType::UnaryOp: {
            wvExprId const operand = generate(ast.data.unary.childIndex, context, host);
            return context.kernel(operatorOpCode(ast.data.unary.op), operand);
        }
        case AstType::Function: {
            wvExprId args[3] = {wvInvalidExprId, wvInvalidExprId, wvInvalidExprId};
            uint32_t arity = 0;
            for (AstLinkIndex linkIndex = ast.data.function.firstArgIndex; linkIndex != wvInvalidIndex && arity != 3;
                 linkIndex = astLinks_[linkIndex].nextIndex)
                args[arity++] = generate(astLinks_[linkIndex].childIndex, context, host);

            return context.kernel(ast.data.function.op, args, arity);
        }
        default: WV_GUARD_OR(false, wvInvalidExprId, "Unknown AST node type");
        }
    }

    bool ExpressionCompiler::isEmpty() const noexcept
    {
        WV_GUARD_OR(status_ == Status::Resolved || status_ == Status::Optimized, false);
        return astRoot_ == wvInvalidIndex;
    }

    bool ExpressionCompiler::isConstant() const noexcept
    {
        WV_GUARD_OR(status_ == Status::Resolved || status_ == Status::Optimized, false);
        if (astRoot_ == wvInvalidIndex)
            return false;
        return ast_[astRoot_].type == AstType::Constant;
    }

    bool ExpressionCompiler::asConstant(float& out_value) const noexcept
    {
        if (!isConstant())
            return false;

        out_value = ast_[astRoot_].data.constant;
        return true;
    }
} // namespace weave

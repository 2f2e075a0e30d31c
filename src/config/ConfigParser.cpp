#include "winorg/config/ConfigParser.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <algorithm>
#include <iostream>

namespace worg {

// ============================================================================
// Lexer Implementation
// ============================================================================

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    tokens.reserve(source_.size() / 8);

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) break;

        char c = peek();

        if ((c == '/' && peekNext() == '/') || c == '#') {
            skipComment();
            continue;
        }

        if (c == '/' && peekNext() == '*') {
            advance(); advance();
            while (!isAtEnd() && !(peek() == '*' && peekNext() == '/')) {
                advance();
            }
            if (isAtEnd()) {
                addError("Unterminated comment");
            } else {
                advance(); advance();
            }
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(number());
            continue;
        }

        if (c == '"') {
            tokens.push_back(string());
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            tokens.push_back(identifier());
            continue;
        }

        switch (c) {
            case '(': tokens.push_back(makeToken(TokenType::LeftParen)); advance(); break;
            case ')': tokens.push_back(makeToken(TokenType::RightParen)); advance(); break;
            case '{': tokens.push_back(makeToken(TokenType::LeftBrace)); advance(); break;
            case '}': tokens.push_back(makeToken(TokenType::RightBrace)); advance(); break;
            case '[': tokens.push_back(makeToken(TokenType::LeftBracket)); advance(); break;
            case ']': tokens.push_back(makeToken(TokenType::RightBracket)); advance(); break;
            case ':': tokens.push_back(makeToken(TokenType::Colon)); advance(); break;
            case ';': tokens.push_back(makeToken(TokenType::Semicolon)); advance(); break;
            case ',': tokens.push_back(makeToken(TokenType::Comma)); advance(); break;
            case '.': tokens.push_back(makeToken(TokenType::Dot)); advance(); break;
            case '+': tokens.push_back(makeToken(TokenType::Plus)); advance(); break;
            case '-': tokens.push_back(makeToken(TokenType::Minus)); advance(); break;
            case '*': tokens.push_back(makeToken(TokenType::Star)); advance(); break;
            case '/': tokens.push_back(makeToken(TokenType::Slash)); advance(); break;

            case '=': {
                Token token = makeToken(TokenType::Assign);
                advance();
                if (peek() == '=') {
                    advance();
                    token.type = TokenType::Equals;
                }
                tokens.push_back(token);
                break;
            }

            case '!': {
                Token token = makeToken(TokenType::Not);
                advance();
                if (peek() == '=') {
                    advance();
                    token.type = TokenType::NotEquals;
                }
                tokens.push_back(token);
                break;
            }

            case '<': {
                Token token = makeToken(TokenType::Less);
                advance();
                if (peek() == '=') {
                    advance();
                    token.type = TokenType::LessEqual;
                }
                tokens.push_back(token);
                break;
            }

            case '>': {
                Token token = makeToken(TokenType::Greater);
                advance();
                if (peek() == '=') {
                    advance();
                    token.type = TokenType::GreaterEqual;
                }
                tokens.push_back(token);
                break;
            }

            case '&':
                advance();
                if (peek() == '&') {
                    advance();
                    tokens.push_back(makeToken(TokenType::And));
                } else {
                    addError("Expected '&' after '&'");
                }
                break;

            case '|':
                advance();
                if (peek() == '|') {
                    advance();
                    tokens.push_back(makeToken(TokenType::Or));
                } else {
                    addError("Expected '|' after '|'");
                }
                break;

            default:
                addError(std::string("Unexpected character: ") + c);
                advance();
                break;
        }
    }

    tokens.push_back(Token(TokenType::EndOfFile, "", line_, column_));
    return tokens;
}

char Lexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[current_];
}

char Lexer::peekNext() const {
    if (current_ + 1 >= source_.length()) return '\0';
    return source_[current_ + 1];
}

char Lexer::advance() {
    char c = source_[current_++];
    column_++;
    if (c == '\n') {
        line_++;
        column_ = 1;
    }
    return c;
}

bool Lexer::isAtEnd() const {
    return current_ >= source_.length();
}

void Lexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void Lexer::skipComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

Token Lexer::makeToken(TokenType type) {
    return Token(type, "", line_, column_);
}

Token Lexer::number() {
    int start_line = line_;
    int start_col = column_;
    std::string num;
    num.reserve(16);

    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        num += advance();
    }

    if (!isAtEnd() && peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))) {
        num += advance();
        while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            num += advance();
        }

        return Token(TokenType::Float, num, start_line, start_col, std::stod(num));
    }

    try {
        return Token(TokenType::Integer, num, start_line, start_col, std::stoi(num));
    } catch (const std::out_of_range&) {
        addError("Integer out of range: " + num);
        return Token(TokenType::Integer, num, start_line, start_col, 0);
    }
}

Token Lexer::string() {
    int start_line = line_;
    int start_col = column_;

    advance(); // opening "

    std::string str;
    str.reserve(32);
    while (!isAtEnd() && peek() != '"') {
        if (peek() == '\\') {
            advance();
            if (!isAtEnd()) {
                char c = advance();
                switch (c) {
                    case 'n': str += '\n'; break;
                    case 't': str += '\t'; break;
                    case '"': str += '"'; break;
                    case '\\': str += '\\'; break;
                    default: str += c; break;
                }
            }
        } else {
            str += advance();
        }
    }

    if (isAtEnd()) {
        addError("Unterminated string");
        return Token(TokenType::Invalid, str, start_line, start_col);
    }

    advance(); // closing "

    return Token(TokenType::String, str, start_line, start_col, str);
}

Token Lexer::identifier() {
    int start_line = line_;
    int start_col = column_;
    std::string text;
    text.reserve(16);

    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        text += advance();
    }

    TokenType type = TokenType::Identifier;
    if (text == "let") type = TokenType::Let;
    else if (text == "if") type = TokenType::If;
    else if (text == "else") type = TokenType::Else;
    else if (text == "true") {
        return Token(TokenType::TokTrue, text, start_line, start_col, true);
    }
    else if (text == "false") {
        return Token(TokenType::TokFalse, text, start_line, start_col, false);
    }

    return Token(type, text, start_line, start_col);
}

void Lexer::addError(const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << line_ << ", Col " << column_ << ": " << message;
    errors_.push_back(oss.str());
}

// ============================================================================
// Parser Implementation
// ============================================================================

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::EndOfFile) {
        tokens_.push_back(Token(TokenType::EndOfFile, "", 0, 0));
    }
}

std::unique_ptr<ast::ConfigFile> Parser::parse() {
    return configFile();
}

const Token& Parser::peek() const {
    return tokens_[current_];
}

const Token& Parser::previous() const {
    return tokens_[current_ > 0 ? current_ - 1 : 0];
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::EndOfFile;
}

const Token& Parser::advance() {
    if (!isAtEnd()) current_++;
    return previous();
}

bool Parser::check(TokenType type) const {
    if (isAtEnd()) return false;
    return peek().type == type;
}

bool Parser::match(std::initializer_list<TokenType> types) {
    for (auto type : types) {
        if (check(type)) {
            advance();
            return true;
        }
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) return advance();

    addError(message);
    return peek();
}

std::unique_ptr<ast::Expression> Parser::makeExpression(ast::ExpressionValue value, int line) {
    auto expr = std::make_unique<ast::Expression>();
    expr->value = std::move(value);
    expr->line = line;
    return expr;
}

std::unique_ptr<ast::ConfigFile> Parser::configFile() {
    auto config = std::make_unique<ast::ConfigFile>();

    while (!isAtEnd()) {
        auto stmt = statement();
        if (stmt) {
            config->statements.push_back(std::move(stmt));
        }
    }

    return config;
}

std::unique_ptr<ast::Statement> Parser::block() {
    const Token& name_token = advance();
    std::string name = name_token.lexeme;
    int line = name_token.line;

    consume(TokenType::Colon, "Expected ':' after block name");
    consume(TokenType::LeftBrace, "Expected '{' to start block");

    ast::Block blk;
    blk.name = name;
    blk.line = line;

    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        auto stmt = statement();
        if (stmt) {
            blk.statements.push_back(std::move(stmt));
        }
    }

    consume(TokenType::RightBrace, "Expected '}' to close block");

    match({TokenType::Semicolon});

    auto stmt = std::make_unique<ast::Statement>();
    stmt->value = std::move(blk);
    stmt->line = line;
    return stmt;
}

std::unique_ptr<ast::Statement> Parser::statement() {
    if (match({TokenType::Let})) {
        return letStatement();
    }

    if (match({TokenType::If})) {
        return ifStatement();
    }

    // Block or assignment; string names allow "SUPER, Q": "..." keybinds
    if (check(TokenType::Identifier) || check(TokenType::String)) {
        size_t saved = current_;
        advance();

        if (check(TokenType::Colon)) {
            advance();
            if (check(TokenType::LeftBrace)) {
                current_ = saved;

                if (!check(TokenType::Identifier)) {
                    addError("Block name must be an identifier");
                    synchronize();
                    return nullptr;
                }
                return block();
            }
        }

        current_ = saved;
        return assignment();
    }

    addError("Expected statement");
    synchronize();
    return nullptr;
}

std::unique_ptr<ast::Statement> Parser::ifStatement() {
    int line = previous().line;

    consume(TokenType::LeftParen, "Expected '(' after if");
    auto condition = expression();
    consume(TokenType::RightParen, "Expected ')' after condition");

    consume(TokenType::LeftBrace, "Expected '{' after if condition");

    std::vector<std::unique_ptr<ast::Statement>> then_branch;
    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        auto stmt = statement();
        if (stmt) {
            then_branch.push_back(std::move(stmt));
        }
    }

    consume(TokenType::RightBrace, "Expected '}' to close if block");

    std::vector<std::unique_ptr<ast::Statement>> else_branch;
    if (match({TokenType::Else})) {
        consume(TokenType::LeftBrace, "Expected '{' after else");

        while (!check(TokenType::RightBrace) && !isAtEnd()) {
            auto stmt = statement();
            if (stmt) {
                else_branch.push_back(std::move(stmt));
            }
        }

        consume(TokenType::RightBrace, "Expected '}' to close else block");
    }

    match({TokenType::Semicolon});

    if (!condition) {
        return nullptr;
    }

    auto stmt = std::make_unique<ast::Statement>();
    stmt->value = ast::IfStatement{
        std::move(condition),
        std::move(then_branch),
        std::move(else_branch)
    };
    stmt->line = line;

    return stmt;
}

std::unique_ptr<ast::Statement> Parser::assignment() {
    std::string name;
    int line = peek().line;

    if (match({TokenType::Identifier})) {
        name = previous().lexeme;
    } else if (match({TokenType::String})) {
        if (auto* val = std::get_if<std::string>(&previous().literal_value)) {
            name = *val;
        }
    } else {
        addError("Expected identifier or string for assignment name");
        synchronize();
        return nullptr;
    }

    if (!check(TokenType::Colon)) {
        addError("Expected ':' after '" + name + "'");
        synchronize();
        return nullptr;
    }
    advance();

    auto value = expression();
    if (!value) {
        synchronize();
        return nullptr;
    }

    match({TokenType::Semicolon});

    auto stmt = std::make_unique<ast::Statement>();
    stmt->value = ast::Assignment{name, std::move(value)};
    stmt->line = line;

    return stmt;
}

std::unique_ptr<ast::Statement> Parser::letStatement() {
    int line = previous().line;

    if (!check(TokenType::Identifier)) {
        addError("Expected identifier after 'let'");
        synchronize();
        return nullptr;
    }

    std::string name = advance().lexeme;

    consume(TokenType::Assign, "Expected '=' after identifier");

    auto value = expression();
    if (!value) {
        synchronize();
        return nullptr;
    }

    match({TokenType::Semicolon});

    auto stmt = std::make_unique<ast::Statement>();
    stmt->value = ast::VariableDeclaration{name, std::move(value)};
    stmt->line = line;

    return stmt;
}

std::unique_ptr<ast::Expression> Parser::expression() {
    return logicalOr();
}

std::unique_ptr<ast::Expression> Parser::logicalOr() {
    auto left = logicalAnd();

    while (left && match({TokenType::Or})) {
        int line = previous().line;
        auto right = logicalAnd();
        if (!right) return nullptr;
        left = makeExpression(ast::BinaryOp{
            ast::BinaryOp::Op::Or,
            std::move(left),
            std::move(right)
        }, line);
    }

    return left;
}

std::unique_ptr<ast::Expression> Parser::logicalAnd() {
    auto left = equality();

    while (left && match({TokenType::And})) {
        int line = previous().line;
        auto right = equality();
        if (!right) return nullptr;
        left = makeExpression(ast::BinaryOp{
            ast::BinaryOp::Op::And,
            std::move(left),
            std::move(right)
        }, line);
    }

    return left;
}

std::unique_ptr<ast::Expression> Parser::equality() {
    auto left = comparison();

    while (left && match({TokenType::Equals, TokenType::NotEquals})) {
        int line = previous().line;
        auto op = previous().type == TokenType::Equals ?
            ast::BinaryOp::Op::Eq : ast::BinaryOp::Op::Ne;

        auto right = comparison();
        if (!right) return nullptr;
        left = makeExpression(ast::BinaryOp{op, std::move(left), std::move(right)}, line);
    }

    return left;
}

std::unique_ptr<ast::Expression> Parser::comparison() {
    auto left = term();

    while (left && match({TokenType::Less, TokenType::Greater,
                          TokenType::LessEqual, TokenType::GreaterEqual})) {
        int line = previous().line;
        ast::BinaryOp::Op op;
        switch (previous().type) {
            case TokenType::Less: op = ast::BinaryOp::Op::Lt; break;
            case TokenType::Greater: op = ast::BinaryOp::Op::Gt; break;
            case TokenType::LessEqual: op = ast::BinaryOp::Op::Le; break;
            case TokenType::GreaterEqual: op = ast::BinaryOp::Op::Ge; break;
            default: op = ast::BinaryOp::Op::Eq; break;
        }

        auto right = term();
        if (!right) return nullptr;
        left = makeExpression(ast::BinaryOp{op, std::move(left), std::move(right)}, line);
    }

    return left;
}

std::unique_ptr<ast::Expression> Parser::term() {
    auto left = factor();

    while (left && match({TokenType::Plus, TokenType::Minus})) {
        int line = previous().line;
        auto op = previous().type == TokenType::Plus ?
            ast::BinaryOp::Op::Add : ast::BinaryOp::Op::Sub;

        auto right = factor();
        if (!right) return nullptr;
        left = makeExpression(ast::BinaryOp{op, std::move(left), std::move(right)}, line);
    }

    return left;
}

std::unique_ptr<ast::Expression> Parser::factor() {
    auto left = unary();

    while (left && match({TokenType::Star, TokenType::Slash})) {
        int line = previous().line;
        auto op = previous().type == TokenType::Star ?
            ast::BinaryOp::Op::Mul : ast::BinaryOp::Op::Div;

        auto right = unary();
        if (!right) return nullptr;
        left = makeExpression(ast::BinaryOp{op, std::move(left), std::move(right)}, line);
    }

    return left;
}

std::unique_ptr<ast::Expression> Parser::unary() {
    if (match({TokenType::Not, TokenType::Minus})) {
        int line = previous().line;
        auto op = previous().type == TokenType::Not ?
            ast::UnaryOp::Op::Not : ast::UnaryOp::Op::Neg;

        auto operand = unary();
        if (!operand) return nullptr;
        return makeExpression(ast::UnaryOp{op, std::move(operand)}, line);
    }

    return primary();
}

std::unique_ptr<ast::Expression> Parser::primary() {
    int line = peek().line;

    if (match({TokenType::Integer})) {
        int value = 0;
        if (auto* val = std::get_if<int>(&previous().literal_value)) {
            value = *val;
        }
        return makeExpression(ast::IntLiteral{value}, line);
    }

    if (match({TokenType::Float})) {
        double value = 0.0;
        if (auto* val = std::get_if<double>(&previous().literal_value)) {
            value = *val;
        }
        return makeExpression(ast::FloatLiteral{value}, line);
    }

    if (match({TokenType::String})) {
        std::string value;
        if (auto* val = std::get_if<std::string>(&previous().literal_value)) {
            value = *val;
        }
        return makeExpression(ast::StringLiteral{value}, line);
    }

    if (match({TokenType::TokTrue, TokenType::TokFalse})) {
        return makeExpression(ast::BoolLiteral{previous().type == TokenType::TokTrue}, line);
    }

    // Identifier or member access
    if (match({TokenType::Identifier})) {
        auto expr = makeExpression(ast::Identifier{previous().lexeme}, line);

        while (match({TokenType::Dot})) {
            if (!check(TokenType::Identifier)) {
                addError("Expected identifier after '.'");
                return nullptr;
            }
            std::string member = advance().lexeme;
            expr = makeExpression(ast::MemberAccess{std::move(expr), member}, line);
        }

        return expr;
    }

    if (match({TokenType::LeftParen})) {
        auto expr = expression();
        if (!expr) return nullptr;
        consume(TokenType::RightParen, "Expected ')' after expression");
        return expr;
    }

    if (match({TokenType::LeftBracket})) {
        ast::ArrayLiteral array;

        if (!check(TokenType::RightBracket)) {
            do {
                auto elem = expression();
                if (!elem) return nullptr;
                array.elements.push_back(std::move(elem));
            } while (match({TokenType::Comma}));
        }

        consume(TokenType::RightBracket, "Expected ']' after array elements");

        return makeExpression(std::move(array), line);
    }

    addError("Expected expression");
    return nullptr;
}

void Parser::addError(const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << peek().line << ": " << message;
    errors_.push_back(oss.str());
}

void Parser::synchronize() {
    // Always make progress past the offending token
    advance();
    while (!isAtEnd()) {
        if (previous().type == TokenType::Semicolon) return;
        if (peek().type == TokenType::RightBrace) return;

        advance();
    }
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

namespace {

std::optional<double> numeric(const ConfigValue& value) {
    if (auto* i = std::get_if<int>(&value)) return static_cast<double>(*i);
    if (auto* d = std::get_if<double>(&value)) return *d;
    return std::nullopt;
}

const char* typeName(const ConfigValue& value) {
    switch (value.index()) {
        case 0: return "integer";
        case 1: return "float";
        case 2: return "string";
        case 3: return "bool";
    }
    return "value";
}

}

ConfigParser::ConfigParser() = default;

bool ConfigParser::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        reportError("Config file not found: " + path.string());
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        reportError("Failed to open config file: " + path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!loadFromString(buffer.str())) {
        return false;
    }

    std::cout << "[Config] Loaded " << path.string() << std::endl;
    return true;
}

bool ConfigParser::loadFromString(const std::string& source) {
    Lexer lexer(source);
    auto tokens = lexer.tokenize();

    if (!lexer.getErrors().empty()) {
        reportErrors(lexer.getErrors());
        return false;
    }

    Parser parser(tokens);
    auto ast = parser.parse();

    if (!parser.getErrors().empty()) {
        reportErrors(parser.getErrors());
        return false;
    }

    // Start over from defaults so a failed file leaves nothing behind
    config_ = Config{};
    return interpret(*ast);
}

std::string ConfigParser::getEmbeddedConfig() {
    return R"(
winorg: {
    // ========================================================================
    // Embedded Default Configuration
    // ========================================================================
    // Used when ~/.config/winorg/winorg.wmi is missing or does not parse

    grid: {
        columns: 2
        rows: 2
        inner_gap: 0
        outer_gap: 0
        span_grow: true
    }

    general: {
        numlock: 2
        confirm_timeout_ms: 500
        dbus: true
    }

    filters: {
        normal: type == ["normal", "dialog", "utility"] && !state.minimized
        here: (desktop == current || state.sticky) && normal
    }

    binds: {
        // Focus
        "SUPER, Tab": "cycle next here"
        "SUPER, SHIFT, Tab": "cycle previous here"

        // Grid placement
        "SUPER, Left": "grid left"
        "SUPER, Right": "grid right"
        "SUPER, Up": "grid up"
        "SUPER, Down": "grid down"
        "SUPER, KP_7": "grid 0 0"
        "SUPER, KP_9": "grid 1 0"
        "SUPER, KP_1": "grid 0 1"
        "SUPER, KP_3": "grid 1 1"
        "SUPER, KP_4": "grid 0 0 1 2"
        "SUPER, KP_6": "grid 1 0 1 2"
        "SUPER, KP_5": "place center 0.5 0.5"

        // Movement
        "SUPER, CTRL, Left": "move-cells -1 0"
        "SUPER, CTRL, Right": "move-cells 1 0"
        "SUPER, CTRL, Up": "move-cells 0 -1"
        "SUPER, CTRL, Down": "move-cells 0 1"
        "SUPER, ALT, Right": "resize-cells right 1"
        "SUPER, ALT, Left": "resize-cells right -1"
        "SUPER, ALT, Down": "resize-cells bottom 1"
        "SUPER, ALT, Up": "resize-cells bottom -1"

        // States
        "SUPER, M": "toggle maximize"
        "SUPER, F": "toggle fullscreen"
        "SUPER, S": "toggle shade"
        "SUPER, A": "toggle above"
        "SUPER, Escape": "reset"
    }
}
)";
}

bool ConfigParser::interpret(const ast::ConfigFile& ast) {
    for (const auto& stmt : ast.statements) {
        if (stmt) {
            evaluateStatement(*stmt);
        }
    }
    return true;
}

void ConfigParser::evaluateStatement(const ast::Statement& stmt) {
    std::visit([this, &stmt](auto&& value) {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, ast::Assignment>) {
            // Top-level name: value pairs behave like let
            config_.variables[value.name] = evaluateExpression(*value.value);
        } else if constexpr (std::is_same_v<T, ast::VariableDeclaration>) {
            config_.variables[value.name] = evaluateExpression(*value.value);
        } else if constexpr (std::is_same_v<T, ast::Block>) {
            evaluateBlock(value);
        } else if constexpr (std::is_same_v<T, ast::IfStatement>) {
            auto condition = evaluateExpression(*value.condition);
            auto cond_value = asBool(condition, "if condition", stmt.line);

            const auto& branch = cond_value.value_or(false) ? value.then_branch : value.else_branch;
            for (const auto& s : branch) {
                evaluateStatement(*s);
            }
        }
    }, stmt.value);
}

void ConfigParser::evaluateBlock(const ast::Block& block) {
    if (block.name == "winorg") {
        for (const auto& stmt : block.statements) {
            evaluateStatement(*stmt);
        }
    } else if (block.name == "grid") {
        evaluateGrid(block);
    } else if (block.name == "general") {
        evaluateGeneral(block);
    } else if (block.name == "filters") {
        evaluateFilters(block);
    } else if (block.name == "binds") {
        evaluateBinds(block);
    } else {
        reportError(block.line, "Unknown block '" + block.name + "'");
    }
}

void ConfigParser::forEachAssignment(const std::vector<std::unique_ptr<ast::Statement>>& statements,
                                     const std::string& block_name,
                                     const std::function<void(const ast::Assignment&, int)>& handler) {
    for (const auto& stmt : statements) {
        std::visit([&](auto&& value) {
            using T = std::decay_t<decltype(value)>;

            if constexpr (std::is_same_v<T, ast::Assignment>) {
                handler(value, stmt->line);
            } else if constexpr (std::is_same_v<T, ast::VariableDeclaration>) {
                config_.variables[value.name] = evaluateExpression(*value.value);
            } else if constexpr (std::is_same_v<T, ast::IfStatement>) {
                auto condition = evaluateExpression(*value.condition);
                auto cond_value = asBool(condition, "if condition", stmt->line);
                forEachAssignment(cond_value.value_or(false) ? value.then_branch : value.else_branch,
                                  block_name, handler);
            } else if constexpr (std::is_same_v<T, ast::Block>) {
                reportError(stmt->line, "Block '" + value.name + "' is not allowed inside '" +
                            block_name + "'");
            }
        }, stmt->value);
    }
}

void ConfigParser::evaluateGrid(const ast::Block& block) {
    forEachAssignment(block.statements, "grid", [this](const ast::Assignment& assign, int line) {
        auto result = evaluateExpression(*assign.value);
        GridSpec& grid = config_.grid;

        if (assign.name == "span_grow") {
            if (auto b = asBool(result, "grid.span_grow", line)) {
                grid.span_grow = *b;
            }
            return;
        }

        auto value = asInt(result, "grid." + assign.name, line);
        if (!value) {
            return;
        }

        if (assign.name == "columns" || assign.name == "rows") {
            if (*value <= 0) {
                reportError(line, "grid." + assign.name + " must be positive");
                return;
            }
            (assign.name == "columns" ? grid.columns : grid.rows) = *value;
            return;
        }

        if (*value < 0) {
            reportError(line, "grid." + assign.name + " must not be negative");
            return;
        }

        if (assign.name == "inner_gap") {
            grid.gaps.inner_gap = *value;
        } else if (assign.name == "outer_gap") {
            grid.gaps.outer_gap = *value;
        } else if (assign.name == "top_gap") {
            grid.gaps.top_gap = *value;
        } else if (assign.name == "bottom_gap") {
            grid.gaps.bottom_gap = *value;
        } else if (assign.name == "left_gap") {
            grid.gaps.left_gap = *value;
        } else if (assign.name == "right_gap") {
            grid.gaps.right_gap = *value;
        } else {
            reportError(line, "Unknown setting 'grid." + assign.name + "'");
        }
    });
}

void ConfigParser::evaluateGeneral(const ast::Block& block) {
    forEachAssignment(block.statements, "general", [this](const ast::Assignment& assign, int line) {
        auto result = evaluateExpression(*assign.value);
        Config::GeneralConfig& general = config_.general;

        if (assign.name == "verbose") {
            if (auto b = asBool(result, "general.verbose", line)) {
                general.verbose = *b;
            }
        } else if (assign.name == "dbus") {
            if (auto b = asBool(result, "general.dbus", line)) {
                general.dbus = *b;
            }
        } else if (assign.name == "numlock") {
            if (auto i = asInt(result, "general.numlock", line)) {
                if (*i < 0 || *i > 2) {
                    reportError(line, "general.numlock must be 0, 1 or 2");
                } else {
                    general.numlock = *i;
                }
            }
        } else if (assign.name == "confirm_timeout_ms") {
            if (auto i = asInt(result, "general.confirm_timeout_ms", line)) {
                if (*i <= 0) {
                    reportError(line, "general.confirm_timeout_ms must be positive");
                } else {
                    general.confirm_timeout_ms = *i;
                }
            }
        } else if (assign.name == "dedup_capacity") {
            if (auto i = asInt(result, "general.dedup_capacity", line)) {
                if (*i <= 0) {
                    reportError(line, "general.dedup_capacity must be positive");
                } else {
                    general.dedup_capacity = *i;
                }
            }
        } else {
            reportError(line, "Unknown setting 'general." + assign.name + "'");
        }
    });
}

void ConfigParser::evaluateFilters(const ast::Block& block) {
    forEachAssignment(block.statements, "filters", [this](const ast::Assignment& assign, int) {
        if (auto filter = compileFilter(*assign.value, assign.name)) {
            config_.filters.define(assign.name, *filter);
        }
    });
}

void ConfigParser::evaluateBinds(const ast::Block& block) {
    forEachAssignment(block.statements, "binds", [this](const ast::Assignment& assign, int line) {
        auto action_value = evaluateExpression(*assign.value);

        auto* action = std::get_if<std::string>(&action_value);
        if (!action) {
            reportError(line, "Action of '" + assign.name + "' must be a string");
            return;
        }

        Config::Keybind bind;
        bind.keys = assign.name;
        bind.action = *action;
        bind.line = line;
        config_.keybinds.push_back(bind);
    });
}

namespace {

// Integer results that do not fit an int continue as double; asInt()
// rejects them where a setting needs an int
ConfigValue widenInt(int64_t value) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return static_cast<double>(value);
    }
    return static_cast<int>(value);
}

}

ConfigValue ConfigParser::evaluateExpression(const ast::Expression& expr) {
    return std::visit([this, &expr](auto&& value) -> ConfigValue {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, ast::IntLiteral>) {
            return value.value;
        } else if constexpr (std::is_same_v<T, ast::FloatLiteral>) {
            return value.value;
        } else if constexpr (std::is_same_v<T, ast::StringLiteral>) {
            return value.value;
        } else if constexpr (std::is_same_v<T, ast::BoolLiteral>) {
            return value.value;
        } else if constexpr (std::is_same_v<T, ast::Identifier>) {
            auto it = config_.variables.find(value.name);
            if (it != config_.variables.end()) {
                return it->second;
            }
            reportError(expr.line, "Unknown variable '" + value.name + "'");
            return 0;
        } else if constexpr (std::is_same_v<T, ast::UnaryOp>) {
            auto operand = evaluateExpression(*value.operand);
            if (value.op == ast::UnaryOp::Op::Not) {
                if (auto* b = std::get_if<bool>(&operand)) return !*b;
                reportError(expr.line, std::string("Cannot negate a ") + typeName(operand));
                return false;
            }
            if (auto* i = std::get_if<int>(&operand)) return widenInt(-static_cast<int64_t>(*i));
            if (auto* d = std::get_if<double>(&operand)) return -*d;
            reportError(expr.line, std::string("Cannot negate a ") + typeName(operand));
            return 0;
        } else if constexpr (std::is_same_v<T, ast::BinaryOp>) {
            using Op = ast::BinaryOp::Op;
            auto left = evaluateExpression(*value.left);
            auto right = evaluateExpression(*value.right);

            if (value.op == Op::And || value.op == Op::Or) {
                auto* l = std::get_if<bool>(&left);
                auto* r = std::get_if<bool>(&right);
                if (!l || !r) {
                    reportError(expr.line, "Logical operators need bool operands");
                    return false;
                }
                return value.op == Op::And ? (*l && *r) : (*l || *r);
            }

            auto ln = numeric(left);
            auto rn = numeric(right);

            if (value.op == Op::Eq || value.op == Op::Ne) {
                bool equal = (ln && rn) ? *ln == *rn : left == right;
                return value.op == Op::Eq ? equal : !equal;
            }

            if (value.op == Op::Add) {
                auto* ls = std::get_if<std::string>(&left);
                auto* rs = std::get_if<std::string>(&right);
                if (ls && rs) return *ls + *rs;
            }

            if (!ln || !rn) {
                reportError(expr.line, std::string("Cannot apply arithmetic to ") +
                            typeName(left) + " and " + typeName(right));
                return 0;
            }

            bool integral = std::holds_alternative<int>(left) && std::holds_alternative<int>(right);

            switch (value.op) {
                case Op::Lt: return *ln < *rn;
                case Op::Gt: return *ln > *rn;
                case Op::Le: return *ln <= *rn;
                case Op::Ge: return *ln >= *rn;
                case Op::Add:
                    if (integral) return widenInt(static_cast<int64_t>(std::get<int>(left)) + std::get<int>(right));
                    return *ln + *rn;
                case Op::Sub:
                    if (integral) return widenInt(static_cast<int64_t>(std::get<int>(left)) - std::get<int>(right));
                    return *ln - *rn;
                case Op::Mul:
                    if (integral) return widenInt(static_cast<int64_t>(std::get<int>(left)) * std::get<int>(right));
                    return *ln * *rn;
                case Op::Div:
                    if (*rn == 0.0) {
                        reportError(expr.line, "Division by zero");
                        return 0;
                    }
                    if (integral) return widenInt(static_cast<int64_t>(std::get<int>(left)) / std::get<int>(right));
                    return *ln / *rn;
                default:
                    return 0;
            }
        } else if constexpr (std::is_same_v<T, ast::MemberAccess>) {
            reportError(expr.line, "'." + value.member + "' is only valid in filters");
            return 0;
        } else if constexpr (std::is_same_v<T, ast::ArrayLiteral>) {
            reportError(expr.line, "Lists are only valid in filters");
            return 0;
        } else {
            return 0;
        }
    }, expr.value);
}

// ============================================================================
// Filter expressions
// ============================================================================

std::optional<Filter> ConfigParser::compileFilter(const ast::Expression& expr, const std::string& preset) {
    return std::visit([this, &expr, &preset](auto&& value) -> std::optional<Filter> {
        using T = std::decay_t<decltype(value)>;
        auto error = [this, &expr, &preset](const std::string& message) -> std::optional<Filter> {
            reportError(expr.line, "Filter '" + preset + "': " + message);
            return std::nullopt;
        };

        if constexpr (std::is_same_v<T, ast::BoolLiteral>) {
            return value.value ? Filter::always() : !Filter::always();
        } else if constexpr (std::is_same_v<T, ast::Identifier>) {
            if (value.name == "active") {
                return Filter::isActive();
            }
            if (auto existing = config_.filters.find(value.name)) {
                return existing;
            }
            return error("unknown attribute or preset '" + value.name + "'");
        } else if constexpr (std::is_same_v<T, ast::MemberAccess>) {
            auto* object = std::get_if<ast::Identifier>(&value.object->value);
            if (!object || object->name != "state") {
                return error("only state.<flag> may be accessed");
            }
            if (value.member == "maximized") {
                return Filter::hasState(WindowState::MaximizedHorz) &&
                       Filter::hasState(WindowState::MaximizedVert);
            }
            auto state = windowStateFromString(value.member);
            if (!state) {
                return error("unknown state '" + value.member + "'");
            }
            return Filter::hasState(*state);
        } else if constexpr (std::is_same_v<T, ast::UnaryOp>) {
            if (value.op != ast::UnaryOp::Op::Not) {
                return error("'-' has no meaning here");
            }
            auto operand = compileFilter(*value.operand, preset);
            if (!operand) return std::nullopt;
            return !*operand;
        } else if constexpr (std::is_same_v<T, ast::BinaryOp>) {
            using Op = ast::BinaryOp::Op;
            if (value.op == Op::And || value.op == Op::Or) {
                auto left = compileFilter(*value.left, preset);
                auto right = compileFilter(*value.right, preset);
                if (!left || !right) return std::nullopt;
                return value.op == Op::And ? (*left && *right) : (*left || *right);
            }
            if (value.op == Op::Eq || value.op == Op::Ne) {
                auto compared = compileComparison(*value.left, *value.right, preset, expr.line);
                if (!compared) return std::nullopt;
                return value.op == Op::Eq ? *compared : !*compared;
            }
            return error("only ==, !=, &&, || and ! are supported");
        } else {
            return error("expected a condition");
        }
    }, expr.value);
}

std::optional<Filter> ConfigParser::compileComparison(const ast::Expression& attribute,
                                                      const ast::Expression& value,
                                                      const std::string& preset, int line) {
    auto error = [this, &preset, line](const std::string& message) -> std::optional<Filter> {
        reportError(line, "Filter '" + preset + "': " + message);
        return std::nullopt;
    };

    auto* attr = std::get_if<ast::Identifier>(&attribute.value);
    if (!attr) {
        return error("left side of a comparison must be type, desktop, class or active");
    }

    // Lists on the right side match any element
    if (auto* list = std::get_if<ast::ArrayLiteral>(&value.value)) {
        if (attr->name == "type") {
            std::vector<WindowType> types;
            for (const auto& elem : list->elements) {
                auto name = evaluateExpression(*elem);
                auto* s = std::get_if<std::string>(&name);
                auto type = s ? windowTypeFromString(*s) : std::nullopt;
                if (!type) {
                    return error("unknown window type in list");
                }
                types.push_back(*type);
            }
            return Filter::typeIn(std::move(types));
        }
        if (attr->name == "desktop") {
            std::vector<int> desktops;
            for (const auto& elem : list->elements) {
                auto number = evaluateExpression(*elem);
                auto* i = std::get_if<int>(&number);
                if (!i) {
                    return error("desktop list must hold integers");
                }
                desktops.push_back(*i);
            }
            return Filter::desktopIn(std::move(desktops));
        }
        return error("lists are only supported for type and desktop");
    }

    if (attr->name == "desktop") {
        if (auto* id = std::get_if<ast::Identifier>(&value.value); id && id->name == "current") {
            return Filter::desktopIsCurrent();
        }
        auto number = evaluateExpression(value);
        auto* i = std::get_if<int>(&number);
        if (!i) {
            return error("desktop must be compared with an integer or current");
        }
        return Filter::desktopIs(*i);
    }

    auto result = evaluateExpression(value);

    if (attr->name == "type") {
        auto* s = std::get_if<std::string>(&result);
        auto type = s ? windowTypeFromString(*s) : std::nullopt;
        if (!type) {
            return error("unknown window type");
        }
        return Filter::typeIs(*type);
    }

    if (attr->name == "class") {
        auto* s = std::get_if<std::string>(&result);
        if (!s) {
            return error("class must be compared with a string");
        }
        return Filter::classIs(*s);
    }

    if (attr->name == "active") {
        auto* b = std::get_if<bool>(&result);
        if (!b) {
            return error("active must be compared with true or false");
        }
        return *b ? Filter::isActive() : !Filter::isActive();
    }

    return error("unknown attribute '" + attr->name + "'");
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<int> ConfigParser::asInt(const ConfigValue& value, const std::string& name, int line) {
    if (auto* i = std::get_if<int>(&value)) {
        return *i;
    }
    if (auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d) ||
            *d < static_cast<double>(std::numeric_limits<int>::min()) ||
            *d > static_cast<double>(std::numeric_limits<int>::max())) {
            reportError(line, name + " is out of range");
            return std::nullopt;
        }
        return static_cast<int>(std::lround(*d));
    }
    reportError(line, name + " expects a number, got a " + typeName(value));
    return std::nullopt;
}

std::optional<bool> ConfigParser::asBool(const ConfigValue& value, const std::string& name, int line) {
    if (auto* b = std::get_if<bool>(&value)) {
        return *b;
    }
    reportError(line, name + " expects true or false, got a " + typeName(value));
    return std::nullopt;
}

void ConfigParser::reportError(const std::string& message) {
    std::cerr << "[Config] " << message << std::endl;
    errors_.push_back(message);
}

void ConfigParser::reportError(int line, const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << line << ": " << message;
    reportError(oss.str());
}

void ConfigParser::reportErrors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        reportError(error);
    }
}

std::filesystem::path ConfigParser::getDefaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "winorg" / "winorg.wmi";
    }

    const char* home = std::getenv("HOME");
    if (!home) return "/etc/winorg/winorg.wmi";

    return std::filesystem::path(home) / ".config" / "winorg" / "winorg.wmi";
}

}

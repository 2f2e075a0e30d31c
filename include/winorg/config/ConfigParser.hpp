#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <unordered_map>
#include <optional>
#include <filesystem>
#include <functional>

#include "winorg/filter/Filter.hpp"
#include "winorg/geometry/GridModel.hpp"

namespace worg {

/**
 * @brief AST Node types for .wmi files
 */
namespace ast {

struct IntLiteral { int value; };
struct FloatLiteral { double value; };
struct StringLiteral { std::string value; };
struct BoolLiteral { bool value; };
struct Identifier { std::string name; };

struct BinaryOp {
    enum class Op { Add, Sub, Mul, Div, And, Or, Eq, Ne, Lt, Gt, Le, Ge };
    Op op;
    std::unique_ptr<struct Expression> left;
    std::unique_ptr<struct Expression> right;
};

struct UnaryOp {
    enum class Op { Not, Neg };
    Op op;
    std::unique_ptr<struct Expression> operand;
};

struct MemberAccess {
    std::unique_ptr<struct Expression> object;
    std::string member;
};

struct ArrayLiteral {
    std::vector<std::unique_ptr<struct Expression>> elements;
};

using ExpressionValue = std::variant<
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    BoolLiteral,
    Identifier,
    BinaryOp,
    UnaryOp,
    MemberAccess,
    ArrayLiteral
>;

struct Expression {
    ExpressionValue value;
    int line{0};
};

struct Assignment {
    std::string name;
    std::unique_ptr<Expression> value;
};

struct VariableDeclaration {
    std::string name;
    std::unique_ptr<Expression> value;
};

struct IfStatement {
    std::unique_ptr<Expression> condition;
    std::vector<std::unique_ptr<struct Statement>> then_branch;
    std::vector<std::unique_ptr<struct Statement>> else_branch;
};

struct Block {
    std::string name;
    std::vector<std::unique_ptr<struct Statement>> statements;
    int line{0};
};

using StatementValue = std::variant<
    Assignment,
    VariableDeclaration,
    IfStatement,
    Block
>;

struct Statement {
    StatementValue value;
    int line{0};
};

// Top-level blocks and declarations in source order
struct ConfigFile {
    std::vector<std::unique_ptr<Statement>> statements;
};

}

enum class TokenType {

    Integer, Float, String, TokTrue, TokFalse,

    Identifier, Let, If, Else,

    Plus, Minus, Star, Slash,
    Equals, NotEquals, Less, Greater, LessEqual, GreaterEqual,
    And, Or, Not,
    Assign, Colon, Semicolon, Comma, Dot,

    LeftBrace, RightBrace, LeftParen, RightParen,
    LeftBracket, RightBracket,

    EndOfFile, Invalid
};

struct Token {
    TokenType type;
    std::string lexeme;
    int line;
    int column;

    std::variant<std::monostate, int, double, std::string, bool> literal_value;

    Token() : type(TokenType::Invalid), lexeme(""), line(0), column(0), literal_value(std::monostate{}) {}

    Token(TokenType t, std::string lex, int l, int c)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(std::monostate{}) {}

    Token(TokenType t, std::string lex, int l, int c, const std::string& lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}

    Token(TokenType t, std::string lex, int l, int c, int lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}

    Token(TokenType t, std::string lex, int l, int c, double lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}

    Token(TokenType t, std::string lex, int l, int c, bool lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(lit) {}
};

class Lexer {
public:
    explicit Lexer(std::string source);

    std::vector<Token> tokenize();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::string source_;
    size_t current_{0};
    int line_{1};
    int column_{1};
    std::vector<std::string> errors_;

    inline char peek() const;
    inline char peekNext() const;
    inline char advance();
    inline bool isAtEnd() const;
    inline void skipWhitespace();
    inline void skipComment();

    Token makeToken(TokenType type);
    Token number();
    Token string();
    Token identifier();

    void addError(const std::string& message);
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    std::unique_ptr<ast::ConfigFile> parse();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::vector<Token> tokens_;
    size_t current_{0};
    std::vector<std::string> errors_;

    inline const Token& peek() const;
    inline const Token& previous() const;
    inline bool isAtEnd() const;
    inline const Token& advance();
    inline bool check(TokenType type) const;
    inline bool match(std::initializer_list<TokenType> types);
    const Token& consume(TokenType type, const std::string& message);

    std::unique_ptr<ast::ConfigFile> configFile();
    std::unique_ptr<ast::Statement> block();
    std::unique_ptr<ast::Statement> statement();
    std::unique_ptr<ast::Statement> ifStatement();
    std::unique_ptr<ast::Statement> assignment();
    std::unique_ptr<ast::Statement> letStatement();
    std::unique_ptr<ast::Expression> expression();
    std::unique_ptr<ast::Expression> logicalOr();
    std::unique_ptr<ast::Expression> logicalAnd();
    std::unique_ptr<ast::Expression> equality();
    std::unique_ptr<ast::Expression> comparison();
    std::unique_ptr<ast::Expression> term();
    std::unique_ptr<ast::Expression> factor();
    std::unique_ptr<ast::Expression> unary();
    std::unique_ptr<ast::Expression> primary();

    std::unique_ptr<ast::Expression> makeExpression(ast::ExpressionValue value, int line);

    void addError(const std::string& message);
    void synchronize();
};

using ConfigValue = std::variant<int, double, std::string, bool>;

class Config {
public:
    struct GeneralConfig {
        // 0 = grab without NumLock, 1 = with NumLock, 2 = both
        int numlock{2};
        int confirm_timeout_ms{500};
        int dedup_capacity{256};
        bool verbose{false};
        bool dbus{true};
    };

    struct Keybind {
        std::string keys;
        std::string action;
        int line{0};
    };

    GridSpec grid;
    GeneralConfig general;
    FilterRegistry filters;
    std::vector<Keybind> keybinds;

    std::unordered_map<std::string, ConfigValue> variables;
};

class ConfigParser {
public:
    ConfigParser();

    bool load(const std::filesystem::path& path = getDefaultConfigPath());

    bool loadFromString(const std::string& source);

    static std::string getEmbeddedConfig();

    const Config& getConfig() const { return config_; }

    // All problems reported since construction, "Line N: ..." where known
    const std::vector<std::string>& getErrors() const { return errors_; }

    /**
     * @brief $XDG_CONFIG_HOME/winorg/winorg.wmi, falling back to
     *        ~/.config/winorg/winorg.wmi
     */
    static std::filesystem::path getDefaultConfigPath();

    /**
     * @brief Compile a filter expression into a Filter
     *
     * Supports &&, ||, ! and parentheses over the leaves active,
     * state.<flag>, type == "<type>", desktop == <n>|current,
     * class == "<class>", lists on the right of == and names of
     * presets defined earlier.
     */
    std::optional<Filter> compileFilter(const ast::Expression& expr, const std::string& preset);

private:
    Config config_;
    std::vector<std::string> errors_;

    bool interpret(const ast::ConfigFile& ast);
    void evaluateBlock(const ast::Block& block);
    void evaluateStatement(const ast::Statement& stmt);
    void evaluateGrid(const ast::Block& block);
    void evaluateGeneral(const ast::Block& block);
    void evaluateFilters(const ast::Block& block);
    void evaluateBinds(const ast::Block& block);

    // Calls @p handler for each assignment, evaluating let and if on the way
    void forEachAssignment(const std::vector<std::unique_ptr<ast::Statement>>& statements,
                           const std::string& block_name,
                           const std::function<void(const ast::Assignment&, int)>& handler);

    std::optional<Filter> compileComparison(const ast::Expression& attribute,
                                            const ast::Expression& value,
                                            const std::string& preset, int line);

    ConfigValue evaluateExpression(const ast::Expression& expr);

    std::optional<int> asInt(const ConfigValue& value, const std::string& name, int line);
    std::optional<bool> asBool(const ConfigValue& value, const std::string& name, int line);

    void reportError(const std::string& message);
    void reportError(int line, const std::string& message);
    void reportErrors(const std::vector<std::string>& errors);
};

}

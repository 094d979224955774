#pragma once

#include <tsorg/lang/token.hpp>
#include <string>
#include <unordered_map>

namespace tsorg {

enum class TsTokenType {
    // Literals
    Identifier,
    PrivateName,        // #field
    Number,
    String,
    Template,           // `...${...}...` as a single token
    Regex,

    // Reserved words (contextual words such as type/from/as stay Identifier)
    KwImport,
    KwExport,
    KwDefault,
    KwFunction,
    KwClass,
    KwConst,
    KwLet,
    KwVar,
    KwEnum,
    KwExtends,
    KwReturn,
    KwNew,
    KwIf,
    KwElse,
    KwFor,
    KwWhile,
    KwDo,
    KwSwitch,
    KwCase,
    KwBreak,
    KwContinue,
    KwThrow,
    KwTry,
    KwCatch,
    KwFinally,
    KwTypeof,
    KwInstanceof,
    KwIn,
    KwVoid,
    KwDelete,
    KwThis,
    KwSuper,
    KwNull,
    KwTrue,
    KwFalse,
    KwYield,
    KwAwait,
    KwDebugger,
    KwWith,

    // Punctuation
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Semicolon,
    Comma,
    Dot,
    QuestionDot,
    Ellipsis,
    Colon,
    Question,
    Assign,
    Arrow,              // =>
    Less,
    Greater,            // always a single '>' so nested generics close cleanly
    Slash,
    Star,
    At,
    Operator,           // every other operator: + - == && ?? += ...

    // Markup (TSX)
    JsxTagOpen,         // < starting an element
    JsxName,            // tag or attribute name
    JsxText,
    JsxTagEnd,          // >
    JsxSelfClose,       // />
    JsxCloseOpen,       // </
    JsxExprStart,       // { opening an expression container
    JsxExprEnd,         // } closing an expression container

    Eof,
    Unknown
};

using TsToken = Token<TsTokenType>;

// Keyword lookup table
const std::unordered_map<std::string, TsTokenType>& ts_keywords();

// Token type name for debugging
const char* ts_token_name(TsTokenType t);

// Reserved word token (usable as a property or member name)
inline bool is_keyword(TsTokenType t) {
    return t >= TsTokenType::KwImport && t <= TsTokenType::KwWith;
}

} // namespace tsorg

/** \file   JSON.cc
 *  \brief  Implementation of JSON-related functionality.
 *
 *  \copyright 2017-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "JSON.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include "StringUtil.h"
#include "TextUtil.h"


namespace JSON {


TokenType Scanner::getToken() {
    if (pushed_back_) {
        pushed_back_ = false;
        return pushed_back_token_;
    }

    skipWhite();

    if (unlikely(ch_ == end_))
        return END_OF_INPUT;

    switch (*ch_) {
    case ',':
        ++ch_;
        return COMMA;
    case ':':
        ++ch_;
        return COLON;
    case '{':
        ++ch_;
        return OPEN_BRACE;
    case '}':
        ++ch_;
        return CLOSE_BRACE;
    case '[':
        ++ch_;
        return OPEN_BRACKET;
    case ']':
        ++ch_;
        return CLOSE_BRACKET;
    case '"':
        return parseStringConstant();
    case 't':
        return expectSequence("true", TRUE_CONST);
    case 'f':
        return expectSequence("false", FALSE_CONST);
    case 'n':
        return expectSequence("null", NULL_CONST);
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return parseNumber();
    default:
        last_error_message_ = "unexpected character '" + std::string(1, *ch_) + "', offset into the input is "
                              + std::to_string(ch_ - begin_) + " bytes!";
        return ERROR;
    }
}


void Scanner::ungetToken(const TokenType token) {
    if (unlikely(pushed_back_))
        throw std::runtime_error("in JSON::Scanner::ungetToken: can't push back two tokens in a row!");
    pushed_back_token_ = token;
    pushed_back_ = true;
}


void Scanner::skipWhite() {
    while (ch_ != end_ and std::isspace(static_cast<unsigned char>(*ch_))) {
        if (*ch_ == '\n')
            ++line_no_;
        ++ch_;
    }
}


TokenType Scanner::expectSequence(const std::string &sequence, const TokenType success_token) {
    for (const char expected_ch : sequence) {
        if (unlikely(ch_ == end_)) {
            last_error_message_ = "expected \"" + sequence + "\" but reached end-of-input!";
            return ERROR;
        } else if (unlikely(*ch_ != expected_ch)) {
            last_error_message_ = "expected \"" + sequence + "\" but found something else!";
            return ERROR;
        }

        ++ch_;
    }

    return success_token;
}


static inline bool IsDigit(const char ch) {
    return ch >= '0' and ch <= '9';
}


TokenType Scanner::parseNumber() {
    std::string number_as_string;
    if (*ch_ == '-')
        number_as_string += *ch_++;

    const auto first_digit_pos(number_as_string.length());
    for (; ch_ != end_ and IsDigit(*ch_); ++ch_)
        number_as_string += *ch_;
    if (unlikely(number_as_string.length() == first_digit_pos)) {
        last_error_message_ = "missing digit or digits after a sign!";
        return ERROR;
    }

    bool is_integer(true);
    if (ch_ != end_ and *ch_ == '.') {
        is_integer = false;
        number_as_string += '.';
        for (++ch_; ch_ != end_ and IsDigit(*ch_); ++ch_)
            number_as_string += *ch_;
    }

    if (ch_ != end_ and (*ch_ == 'e' or *ch_ == 'E')) {
        is_integer = false;
        number_as_string += *ch_++;
        if (ch_ != end_ and (*ch_ == '+' or *ch_ == '-'))
            number_as_string += *ch_++;
        if (unlikely(ch_ == end_ or not IsDigit(*ch_))) {
            last_error_message_ = "missing digits for the exponent!";
            return ERROR;
        }
        for (; ch_ != end_ and IsDigit(*ch_); ++ch_)
            number_as_string += *ch_;
    }

    if (is_integer) {
        errno = 0;
        char *endptr;
        const long long value(std::strtoll(number_as_string.c_str(), &endptr, 10));
        if (likely(errno == 0 and *endptr == '\0')) {
            last_integer_constant_ = static_cast<int64_t>(value);
            return INTEGER_CONST;
        }
        errno = 0; // Too large for 64 bits, treat it as a floating point value.
    }

    double value;
    if (unlikely(not StringUtil::ToDouble(number_as_string, &value))) {
        last_error_message_ = "failed to convert \"" + number_as_string + "\" to a floating point value!";
        return ERROR;
    }

    last_double_constant_ = value;
    return DOUBLE_CONST;
}


bool Scanner::readHexQuad(uint32_t * const code_unit) {
    *code_unit = 0;
    for (unsigned i(0); i < 4; ++i) {
        if (unlikely(ch_ == end_)) {
            last_error_message_ = "unexpected end-of-input while looking for a \\unnnn escape!";
            return false;
        }
        if (unlikely(not std::isxdigit(static_cast<unsigned char>(*ch_)))) {
            last_error_message_ = "invalid hex digit in a \\unnnn escape!";
            return false;
        }
        *code_unit = (*code_unit << 4u) | StringUtil::FromHex(*ch_++);
    }

    return true;
}


// Converts the nnnn part of \unnnn to UTF-8, consuming a second escape if we have a surrogate pair.
bool Scanner::UTF16EscapeToUTF8(std::string * const utf8) {
    uint32_t u1;
    if (unlikely(not readHexQuad(&u1)))
        return false;

    if (u1 < 0xD800 or u1 > 0xDFFF) {
        *utf8 = TextUtil::UTF32ToUTF8(u1);
        return true;
    }

    if (unlikely(u1 > 0xDBFF)) {
        last_error_message_ = "\\u escape is neither a standalone character nor a valid first half of a UTF-16 surrogate pair!";
        return false;
    }

    if (unlikely(ch_ == end_ or *ch_++ != '\\' or ch_ == end_ or *ch_++ != 'u')) {
        last_error_message_ = "could not find the 2nd half of a surrogate pair!";
        return false;
    }

    uint32_t u2;
    if (unlikely(not readHexQuad(&u2)))
        return false;
    if (unlikely(u2 < 0xDC00 or u2 > 0xDFFF)) {
        last_error_message_ = "invalid 2nd half of a surrogate pair!";
        return false;
    }

    *utf8 = TextUtil::UTF32ToUTF8(0x10000u + ((u1 - 0xD800u) << 10u) + (u2 - 0xDC00u));
    return true;
}


TokenType Scanner::parseStringConstant() {
    ++ch_; // Skip over initial double quote.

    const unsigned start_line_no(line_no_);
    std::string string_value;
    while (ch_ != end_ and *ch_ != '"') {
        if (*ch_ != '\\')
            string_value += *ch_++;
        else { // Deal w/ an escape sequence.
            if (unlikely(ch_ + 1 == end_)) {
                last_error_message_ = "end-of-input encountered while parsing a string constant, starting on line "
                                      + std::to_string(start_line_no) + "!";
                return ERROR;
            }
            ++ch_;
            switch (*ch_) {
            case '/':
            case '"':
            case '\\':
                string_value += *ch_++;
                break;
            case 'b':
                ++ch_;
                string_value += '\b';
                break;
            case 'f':
                ++ch_;
                string_value += '\f';
                break;
            case 'n':
                ++ch_;
                string_value += '\n';
                break;
            case 'r':
                ++ch_;
                string_value += '\r';
                break;
            case 't':
                ++ch_;
                string_value += '\t';
                break;
            case 'u': {
                ++ch_;
                std::string utf8;
                if (unlikely(not UTF16EscapeToUTF8(&utf8)))
                    return ERROR;
                string_value += utf8;
                break;
            }
            default:
                last_error_message_ = "unexpected escape \\" + std::string(1, *ch_) + " in string constant!";
                return ERROR;
            }
        }
    }

    if (unlikely(ch_ == end_)) {
        last_error_message_ = "end-of-input encountered while parsing a string constant, starting on line "
                              + std::to_string(start_line_no) + "!";
        return ERROR;
    }
    ++ch_; // Skip over closing double quote.

    last_string_constant_ = string_value;
    return STRING_CONST;
}


std::string JSONNode::TypeToString(const Type type) {
    switch (type) {
    case BOOLEAN_NODE:
        return "BOOLEAN_NODE";
    case NULL_NODE:
        return "NULL_NODE";
    case STRING_NODE:
        return "STRING_NODE";
    case INT64_NODE:
        return "INT64_NODE";
    case DOUBLE_NODE:
        return "DOUBLE_NODE";
    case OBJECT_NODE:
        return "OBJECT_NODE";
    case ARRAY_NODE:
        return "ARRAY_NODE";
    }

    throw std::runtime_error("in JSON::JSONNode::TypeToString: we should never get here!");
}


bool ObjectNode::insert(const std::string &label, const std::shared_ptr<JSONNode> &node) {
    return entries_.emplace(label, node).second;
}


std::shared_ptr<const JSONNode> ObjectNode::getNode(const std::string &label) const {
    const auto entry(entries_.find(label));
    return entry == entries_.cend() ? nullptr : entry->second;
}


std::string ObjectNode::getOptionalStringValue(const std::string &label, const std::string &default_value) const {
    const auto string_node(getOptionalNode<StringNode>(label, STRING_NODE));
    return string_node == nullptr ? default_value : string_node->getValue();
}


std::string ObjectNode::getScalarAsString(const std::string &label, const std::string &default_value) const {
    const auto node(getNode(label));
    if (node == nullptr)
        return default_value;

    switch (node->getType()) {
    case STRING_NODE:
        return std::static_pointer_cast<const StringNode>(node)->getValue();
    case INT64_NODE:
        return std::to_string(std::static_pointer_cast<const IntegerNode>(node)->getValue());
    case DOUBLE_NODE:
        return StringUtil::ToString(std::static_pointer_cast<const DoubleNode>(node)->getValue(), 0);
    default:
        return default_value;
    }
}


std::shared_ptr<const JSONNode> ArrayNode::getNode(const size_t index) const {
    if (unlikely(index >= values_.size()))
        throw std::runtime_error("in JSON::ArrayNode::getNode: index " + std::to_string(index) + " out of range [0,"
                                 + std::to_string(values_.size()) + ")!");

    return values_[index];
}


std::shared_ptr<const ObjectNode> ArrayNode::getOptionalObjectNode(const size_t index) const {
    const auto node(getNode(index));
    if (node->getType() != OBJECT_NODE)
        return nullptr;
    return std::static_pointer_cast<const ObjectNode>(node);
}


bool Parser::parseObject(std::shared_ptr<JSONNode> * const new_object_node) {
    const auto object_node(std::make_shared<ObjectNode>());
    *new_object_node = object_node;
    TokenType token(scanner_.getToken());
    if (unlikely(token == CLOSE_BRACE))
        return true; // We have an empty object.

    for (;;) {
        if (unlikely(token != STRING_CONST)) {
            error_message_ = "label expected on line " + std::to_string(scanner_.getLineNumber())
                             + " found '" + TokenTypeToString(token) + "' instead!";
            return false;
        }
        const std::string label(scanner_.getLastStringConstant());

        token = scanner_.getToken();
        if (unlikely(token != COLON)) {
            error_message_ = "colon expected after label on line " + std::to_string(scanner_.getLineNumber())
                + " found '" + TokenTypeToString(token) + "' instead!";
            return false;
        }

        std::shared_ptr<JSONNode> new_node;
        if (unlikely(not parseAny(&new_node)))
            return false;

        object_node->insert(label, new_node);

        token = scanner_.getToken();
        if (token == COMMA)
            token = scanner_.getToken();
        else if (token == CLOSE_BRACE)
            return true;
        else {
            error_message_ = "expected ',' or '}' on line " + std::to_string(scanner_.getLineNumber())
                             + " but found '" + TokenTypeToString(token) + "'!";
            return false;
        }
    }
}


bool Parser::parseArray(std::shared_ptr<JSONNode> * const new_array_node) {
    const auto array_node(std::make_shared<ArrayNode>());
    *new_array_node = array_node;
    TokenType token(scanner_.getToken());
    if (unlikely(token == CLOSE_BRACKET))
        return true; // Empty array.
    scanner_.ungetToken(token);

    for (;;) {
        std::shared_ptr<JSONNode> new_node;
        if (unlikely(not parseAny(&new_node)))
            return false;
        array_node->push_back(new_node);

        token = scanner_.getToken();
        if (token == COMMA)
            /* Intentionally empty! */;
        else if (token == CLOSE_BRACKET)
            return true;
        else {
            error_message_ = "expected ',' or ']' on line " + std::to_string(scanner_.getLineNumber())
                             + " but found '" + TokenTypeToString(token) + "'!";
            return false;
        }
    }
}


bool Parser::parseAny(std::shared_ptr<JSONNode> * const new_node) {
    *new_node = nullptr;

    const TokenType token(scanner_.getToken());
    switch (token) {
    case OPEN_BRACE:
        return parseObject(new_node);
    case OPEN_BRACKET:
        return parseArray(new_node);
    case INTEGER_CONST:
        *new_node = std::make_shared<IntegerNode>(scanner_.getLastIntegerConstant());
        return true;
    case DOUBLE_CONST:
        *new_node = std::make_shared<DoubleNode>(scanner_.getLastDoubleConstant());
        return true;
    case STRING_CONST:
        *new_node = std::make_shared<StringNode>(scanner_.getLastStringConstant());
        return true;
    case TRUE_CONST:
        *new_node = std::make_shared<BooleanNode>(true);
        return true;
    case FALSE_CONST:
        *new_node = std::make_shared<BooleanNode>(false);
        return true;
    case NULL_CONST:
        *new_node = std::make_shared<NullNode>();
        return true;
    case ERROR:
        error_message_ = scanner_.getLastErrorMessage() + " (line: " + std::to_string(scanner_.getLineNumber()) + ")";
        return false;
    case END_OF_INPUT:
        error_message_ = "unexpected end of input!";
        return false;
    default:
        error_message_ = "syntax error, found '" + TokenTypeToString(token)
                         + "' but expected some kind of object on line " + std::to_string(scanner_.getLineNumber())
                         + "!";
        return false;
    }
}


bool Parser::parse(std::shared_ptr<JSONNode> * const tree_root) {
    if (unlikely(not parseAny(tree_root)))
        return false;

    const TokenType token(scanner_.getToken());
    if (likely(token == END_OF_INPUT))
        return true;

    error_message_ = "found trailing garbage " + TokenTypeToString(token) + " on line "
                     + std::to_string(scanner_.getLineNumber()) + "!";
    return false;
}


std::string TokenTypeToString(const TokenType token) {
    switch (token) {
    case COMMA:
        return ",";
    case COLON:
        return ":";
    case OPEN_BRACE:
        return "{";
    case CLOSE_BRACE:
        return "}";
    case OPEN_BRACKET:
        return "[";
    case CLOSE_BRACKET:
        return "]";
    case TRUE_CONST:
        return "true";
    case FALSE_CONST:
        return "false";
    case NULL_CONST:
        return "null";
    case INTEGER_CONST:
        return "integer constant";
    case DOUBLE_CONST:
        return "double constant";
    case STRING_CONST:
        return "string constant";
    case END_OF_INPUT:
        return "end of input";
    case ERROR:
        return "error";
    }

    throw std::runtime_error("in JSON::TokenTypeToString: we should never get here!");
}


} // namespace JSON

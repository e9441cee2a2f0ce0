/** \file   JSON.h
 *  \brief  Interface for JSON-related functionality.
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
#pragma once


#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <cinttypes>
#include "util.h"


namespace JSON {


enum TokenType {
    COMMA,
    COLON,
    OPEN_BRACE,
    CLOSE_BRACE,
    OPEN_BRACKET,
    CLOSE_BRACKET,
    TRUE_CONST,
    FALSE_CONST,
    NULL_CONST,
    INTEGER_CONST,
    DOUBLE_CONST,
    STRING_CONST,
    END_OF_INPUT,
    ERROR
};


class Scanner {
    std::string last_string_constant_;
    int64_t last_integer_constant_;
    double last_double_constant_;
    std::string last_error_message_;
    unsigned line_no_;
    std::string::const_iterator ch_;
    const std::string::const_iterator begin_;
    const std::string::const_iterator end_;
    bool pushed_back_;
    TokenType pushed_back_token_;

public:
    explicit Scanner(const std::string &json_document)
        : last_integer_constant_(0), last_double_constant_(0.0), line_no_(1), ch_(json_document.cbegin()),
          begin_(json_document.cbegin()), end_(json_document.cend()), pushed_back_(false), pushed_back_token_(ERROR) { }
    TokenType getToken();
    void ungetToken(const TokenType token);
    const std::string &getLastStringConstant() const { return last_string_constant_; }
    int64_t getLastIntegerConstant() const { return last_integer_constant_; }
    double getLastDoubleConstant() const { return last_double_constant_; }
    unsigned getLineNumber() const { return line_no_; }
    const std::string &getLastErrorMessage() const { return last_error_message_; }

private:
    void skipWhite();

    /** \return "success_token" if the characters of "sequence" where scanned, else ERROR.
     *  \note Sets last_error_message_, if it returns ERROR. */
    TokenType expectSequence(const std::string &sequence, const TokenType success_token);

    /** \return Upon success, either INTEGER_CONST, if the scanned number can be represented as a 64-bit integer, o/w
     *          DOUBLE_CONST.  Upon failure ERROR will be returned and last_error_message_ set accordingly. */
    TokenType parseNumber();

    bool readHexQuad(uint32_t * const code_unit);
    bool UTF16EscapeToUTF8(std::string * const utf8);

    /** \return Either STRING_CONST upon success or ERROR upon failure. */
    TokenType parseStringConstant();
};


class JSONNode {
public:
    enum Type { BOOLEAN_NODE, NULL_NODE, STRING_NODE, INT64_NODE, DOUBLE_NODE, OBJECT_NODE, ARRAY_NODE };

public:
    virtual ~JSONNode() { }

    virtual Type getType() const = 0;
    static std::string TypeToString(const Type type);
};


class BooleanNode final : public JSONNode {
    bool value_;

public:
    explicit BooleanNode(const bool value): value_(value) { }
    inline virtual Type getType() const override { return BOOLEAN_NODE; }
    bool getValue() const { return value_; }
};


class NullNode final : public JSONNode {
public:
    inline virtual Type getType() const override { return NULL_NODE; }
};


class StringNode final : public JSONNode {
    std::string value_;

public:
    explicit StringNode(const std::string &value): value_(value) { }
    inline virtual Type getType() const override { return STRING_NODE; }
    const std::string &getValue() const { return value_; }
};


class IntegerNode final : public JSONNode {
    int64_t value_;

public:
    explicit IntegerNode(const int64_t value): value_(value) { }
    inline virtual Type getType() const override { return INT64_NODE; }
    int64_t getValue() const { return value_; }
};


class DoubleNode final : public JSONNode {
    double value_;

public:
    explicit DoubleNode(const double value): value_(value) { }
    virtual Type getType() const override { return DOUBLE_NODE; }
    double getValue() const { return value_; }
};


class ArrayNode;


class ObjectNode final : public JSONNode {
    std::unordered_map<std::string, std::shared_ptr<JSONNode>> entries_;

    template <typename ReturnType>
    std::shared_ptr<const ReturnType> getOptionalNode(const std::string &label, const Type node_type) const {
        const auto entry(entries_.find(label));
        if (entry == entries_.cend() or entry->second->getType() != node_type)
            return nullptr;
        return std::static_pointer_cast<const ReturnType>(entry->second);
    }

public:
    typedef std::unordered_map<std::string, std::shared_ptr<JSONNode>>::const_iterator const_iterator;

public:
    virtual Type getType() const override { return OBJECT_NODE; }
    bool empty() const { return entries_.empty(); }

    /** \return False if the new node was not inserted because the label already existed, o/w true. */
    bool insert(const std::string &label, const std::shared_ptr<JSONNode> &node);

    /** \return The node for "label" or nullptr if there is none. */
    std::shared_ptr<const JSONNode> getNode(const std::string &label) const;

    // Returns nullptr or the default value if the node is missing or has a different type.
    std::shared_ptr<const ArrayNode> getOptionalArrayNode(const std::string &label) const {
        return getOptionalNode<ArrayNode>(label, ARRAY_NODE);
    }
    std::shared_ptr<const ObjectNode> getOptionalObjectNode(const std::string &label) const {
        return getOptionalNode<ObjectNode>(label, OBJECT_NODE);
    }
    std::string getOptionalStringValue(const std::string &label, const std::string &default_value = "") const;

    /** \brief  Renders a string, integer or double node as a string.  Returns "default_value" for anything else. */
    std::string getScalarAsString(const std::string &label, const std::string &default_value = "") const;

    const_iterator begin() const { return entries_.cbegin(); }
    const_iterator end() const { return entries_.cend(); }
};


class ArrayNode final : public JSONNode {
    std::vector<std::shared_ptr<JSONNode>> values_;

public:
    typedef std::vector<std::shared_ptr<JSONNode>>::const_iterator const_iterator;

public:
    virtual Type getType() const override { return ARRAY_NODE; }
    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }

    /** \note Throws if "index" is out of range. */
    std::shared_ptr<const JSONNode> getNode(const size_t index) const;

    /** \return The object node at "index" or nullptr if the node at "index" is not an object. */
    std::shared_ptr<const ObjectNode> getOptionalObjectNode(const size_t index) const;

    const_iterator begin() const { return values_.cbegin(); }
    const_iterator end() const { return values_.cend(); }
    void push_back(const std::shared_ptr<JSONNode> &node) { values_.push_back(node); }
};


class Parser {
    Scanner scanner_;
    std::string error_message_;

public:
    explicit Parser(const std::string &json_document): scanner_(json_document) { }

    // Typical use case:
    //
    // std::shared_ptr<JSONNode> tree_root;
    // if (not (parser.parse(&tree_root)))
    //     LOG_WARNING(...);
    //  ...
    bool parse(std::shared_ptr<JSONNode> * const tree_root);

    const std::string &getErrorMessage() const { return error_message_; }

private:
    bool parseObject(std::shared_ptr<JSONNode> * const new_object_node);
    bool parseArray(std::shared_ptr<JSONNode> * const new_array_node);
    bool parseAny(std::shared_ptr<JSONNode> * const new_node);
};


std::string TokenTypeToString(const TokenType token);


} // namespace JSON

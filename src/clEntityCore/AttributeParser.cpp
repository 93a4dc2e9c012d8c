
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "AttributeParser.h"
#include "FileUtils.h"
#include "Logging.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>


namespace
{
	enum TokenType
	{
		TOKEN_NONE,
		TOKEN_EQUALS,
		TOKEN_COMMA,
		TOKEN_LPAREN,
		TOKEN_RPAREN,
		TOKEN_INT,
		TOKEN_FLOAT,
		TOKEN_SYMBOL,
		TOKEN_STRING,
	};


	struct Token
	{
		Token()
			: type(TOKEN_NONE)
		{
		}

		Token(TokenType t, const char* p, size_t l)
			: type(t)
			, text(p, l)
		{
		}

		TokenType type;
		std::string text;
	};


	// Error reporting feedback, passed through the lexer and parser
	struct ParseContext
	{
		const char* filename;
		int line;
	};


	void Warn(const ParseContext& ctx, const char* message)
	{
		LOG(warnings, INFO, "%s(%d) : warning - %s\n", ctx.filename, ctx.line, message);
	}


	const char* ParseString(const ParseContext& ctx, const char* text, std::vector<Token>& tokens)
	{
		// Start one character after the quote and loop until the end
		const char* start = ++text;
		while (*text && *text != '\"')
		{
			text++;
		}

		// If the string terminated correctly, add it
		if (*text == '\"')
		{
			tokens.push_back(Token(TOKEN_STRING, start, text - start));
			return text + 1;
		}

		Warn(ctx, "String not terminated correctly");
		return 0;
	}


	const char* ParseSymbol(const char* text, std::vector<Token>& tokens)
	{
		// Match the pattern [A-Za-z0-9_:]*
		const char* start = text;
		while (*text && (isalnum((unsigned char)*text) || *text == '_' || *text == ':'))
		{
			text++;
		}

		tokens.push_back(Token(TOKEN_SYMBOL, start, text - start));
		return text;
	}


	const char* ParseNumber(const ParseContext& ctx, const char* text, std::vector<Token>& tokens)
	{
		// Match all digits, taking into account this might be a floating pointer number
		bool is_float = false;
		const char* start = text;
		if (*text == '-')
			text++;
		while (*text && (isdigit((unsigned char)*text) || *text == '.'))
		{
			if (*text == '.')
			{
				// Only one decimal place is allowed
				if (is_float)
				{
					Warn(ctx, "Floating point number has more than one decimal point");
					return 0;
				}

				is_float = true;
			}

			text++;
		}

		tokens.push_back(Token(is_float ? TOKEN_FLOAT : TOKEN_INT, start, text - start));
		return text;
	}


	std::vector<Token> Lexer(const ParseContext& ctx, const char* text)
	{
		// Tokenise the input character stream
		std::vector<Token> tokens;
		while (char c = *text)
		{
			switch (c)
			{
			// Process single character tokens
			case ('='):
				tokens.push_back(Token(TOKEN_EQUALS, text, 1));
				text++;
				break;
			case (','):
				tokens.push_back(Token(TOKEN_COMMA, text, 1));
				text++;
				break;
			case ('('):
				tokens.push_back(Token(TOKEN_LPAREN, text, 1));
				text++;
				break;
			case (')'):
				tokens.push_back(Token(TOKEN_RPAREN, text, 1));
				text++;
				break;

			case ('\"'):
				text = ParseString(ctx, text, tokens);
				break;

			// Skip whitespace
			case (' '):
			case ('\t'):
			case ('\r'):
			case ('\n'):
				text++;
				break;

			case ('_'):
				text = ParseSymbol(text, tokens);
				break;

			case ('-'):
				text = ParseNumber(ctx, text, tokens);
				break;

			default:
				if (isalpha((unsigned char)c))
				{
					text = ParseSymbol(text, tokens);
				}

				else if (isdigit((unsigned char)c))
				{
					text = ParseNumber(ctx, text, tokens);
				}

				else
				{
					Warn(ctx, "Invalid character in attribute");
					text = 0;
				}
			}

			// An error has been signalled above so abort lexing and clear the tokens so no parsing occurs
			if (text == 0)
			{
				tokens.clear();
				break;
			}
		}

		return tokens;
	}


	const Token* CheckNext(const std::vector<Token>& tokens, size_t& pos, TokenType type)
	{
		// Keep within token stream limits
		if (pos >= tokens.size())
		{
			return 0;
		}

		// Increment and return if there's a match
		if (tokens[pos].type == type)
		{
			return &tokens[pos++];
		}

		return 0;
	}


	bool MakeValue(const Token& token, clent::AnnotationValue& value)
	{
		value.text = token.text;
		switch (token.type)
		{
		case (TOKEN_INT):
			value.kind = clent::AnnotationValue::KIND_INT;
			value.int_value = atoi(token.text.c_str());
			value.float_value = (float)value.int_value;
			return true;
		case (TOKEN_FLOAT):
			value.kind = clent::AnnotationValue::KIND_FLOAT;
			value.float_value = (float)atof(token.text.c_str());
			value.int_value = (int)value.float_value;
			return true;
		case (TOKEN_SYMBOL):
			value.kind = clent::AnnotationValue::KIND_SYMBOL;
			return true;
		case (TOKEN_STRING):
			value.kind = clent::AnnotationValue::KIND_TEXT;
			return true;
		default:
			return false;
		}
	}


	bool ArgumentDef(const ParseContext& ctx, clent::AnnotationInstance& annotation, const std::vector<Token>& tokens, size_t& pos)
	{
		const Token* key = CheckNext(tokens, pos, TOKEN_SYMBOL);
		if (key == 0)
		{
			Warn(ctx, "Argument name expected in attribute");
			return false;
		}

		clent::AnnotationArgument argument;
		argument.key = key->text;

		// Arguments without a value are flags
		if (CheckNext(tokens, pos, TOKEN_EQUALS))
		{
			if (pos >= tokens.size() || !MakeValue(tokens[pos], argument.value))
			{
				Warn(ctx, "Value expected for attribute argument");
				return false;
			}
			pos++;
		}

		annotation.arguments.push_back(argument);
		return true;
	}


	bool AttributeDef(const ParseContext& ctx, clent::Dialect dialect, clent::AnnotationList& annotations, const std::vector<Token>& tokens, size_t& pos)
	{
		// Expect a symbol to start the attribute
		const Token* attribute_name = CheckNext(tokens, pos, TOKEN_SYMBOL);
		if (attribute_name == 0)
		{
			Warn(ctx, "Symbol expected in attribute");
			return false;
		}

		clent::AnnotationInstance annotation;
		annotation.dialect = dialect;
		annotation.name = attribute_name->text;
		annotation.filename = ctx.filename;
		annotation.line = ctx.line;

		// Shorthand assignment stores its value under "value"
		if (CheckNext(tokens, pos, TOKEN_EQUALS))
		{
			clent::AnnotationArgument argument;
			argument.key = "value";
			if (pos >= tokens.size() || !MakeValue(tokens[pos], argument.value))
			{
				Warn(ctx, "Value expected for attribute assignment");
				return false;
			}
			pos++;
			annotation.arguments.push_back(argument);
		}

		// Grouped arguments
		else if (CheckNext(tokens, pos, TOKEN_LPAREN))
		{
			if (!CheckNext(tokens, pos, TOKEN_RPAREN))
			{
				if (!ArgumentDef(ctx, annotation, tokens, pos))
					return false;

				while (CheckNext(tokens, pos, TOKEN_COMMA))
				{
					if (!ArgumentDef(ctx, annotation, tokens, pos))
						return false;
				}

				if (!CheckNext(tokens, pos, TOKEN_RPAREN))
				{
					Warn(ctx, "Closing bracket expected in attribute");
					return false;
				}
			}
		}

		annotations.push_back(annotation);
		return true;
	}


	clent::AnnotationList Parser(const ParseContext& ctx, clent::Dialect dialect, const std::vector<Token>& tokens)
	{
		// Don't parse if there are no tokens (this could be a lexer error or an empty annotation)
		clent::AnnotationList annotations;
		if (tokens.empty())
		{
			return annotations;
		}

		// Parse the first attribute
		size_t pos = 0;
		if (!AttributeDef(ctx, dialect, annotations, tokens, pos))
		{
			return annotations;
		}

		// Loop parsing any remaining attributes
		while (pos < tokens.size())
		{
			if (!CheckNext(tokens, pos, TOKEN_COMMA))
			{
				Warn(ctx, "Comma expected between attributes");
				break;
			}
			if (!AttributeDef(ctx, dialect, annotations, tokens, pos))
			{
				break;
			}
		}

		return annotations;
	}


	std::string FormatValue(const clent::AnnotationValue& value)
	{
		if (value.kind == clent::AnnotationValue::KIND_TEXT)
			return "\"" + value.text + "\"";
		return value.text;
	}
}


bool clent::SplitAnnotationText(const std::string& annotation, Dialect& dialect, std::string& text)
{
	if (startswith(annotation, "attr:"))
	{
		dialect = DIALECT_NATIVE;
		text = annotation.substr(5);
		return true;
	}
	if (startswith(annotation, "jpa:"))
	{
		dialect = DIALECT_JPA;
		text = annotation.substr(4);
		return true;
	}
	return false;
}


clent::AnnotationList clent::ParseAttributes(Dialect dialect, const char* text, const char* filename, int line)
{
	ParseContext ctx;
	ctx.filename = filename;
	ctx.line = line;

	// Make things a little simpler by lexing all tokens at once before parsing
	std::vector<Token> tokens = Lexer(ctx, text);
	return Parser(ctx, dialect, tokens);
}


std::string clent::FormatAttribute(const AnnotationInstance& annotation)
{
	std::string text = annotation.name;
	if (annotation.arguments.empty())
		return text;

	// Use the shorthand for lone values
	const AnnotationArgument& first = annotation.arguments[0];
	if (annotation.arguments.size() == 1 && first.key == "value" && first.value.kind != AnnotationValue::KIND_FLAG)
		return text + " = " + FormatValue(first.value);

	text += "(";
	for (size_t i = 0; i < annotation.arguments.size(); i++)
	{
		const AnnotationArgument& argument = annotation.arguments[i];
		if (i)
			text += ", ";
		text += argument.key;
		if (argument.value.kind != AnnotationValue::KIND_FLAG)
			text += " = " + FormatValue(argument.value);
	}
	text += ")";
	return text;
}

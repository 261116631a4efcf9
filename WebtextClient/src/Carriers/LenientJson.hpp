#pragma once

#include <QByteArray>
#include <QJsonObject>
#include "../Exception.hpp"





/** Parser for the JavaScript-object-literal-like responses that some carriers send instead of proper JSON:
comments, single-quoted strings, unquoted keys and stray " * 123" multiplications.
The text is massaged into proper JSON and then parsed by QJsonDocument. */
namespace LenientJson
{

/** Thrown when the text cannot be parsed even after the fixups. */
class ParseError:
	public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};


/** Returns the text with the fixups applied, so that it is (hopefully) valid JSON. */
QByteArray normalize(const QByteArray & aText);

/** Parses the text into a JSON object.
Throws a ParseError if the text isn't parseable or its top-level value isn't an object. */
QJsonObject parseObject(const QByteArray & aText);

}  // namespace LenientJson

#include "LenientJson.hpp"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>





QByteArray LenientJson::normalize(const QByteArray & aText)
{
	auto text = QString::fromUtf8(aText);

	// Strip the comments; a "//" right after a ':' is kept, it is most likely a part of an URL:
	static const QRegularExpression reBlockComment("/\\*.*?\\*/", QRegularExpression::DotMatchesEverythingOption);
	static const QRegularExpression reLineComment("(^|[^:])//[^\\n]*", QRegularExpression::MultilineOption);
	text.replace(reBlockComment, QString());
	text.replace(reLineComment, "\\1");

	// Fix the malformed parts:
	text.replace('\'', '"');
	static const QRegularExpression reMultiplication(" \\* \\d*,");
	text.replace(reMultiplication, ",");

	// Quote the bare keys:
	static const QRegularExpression reBareKey("([{,]\\s*)(\\w+)\\s*:");
	text.replace(reBareKey, "\\1\"\\2\":");

	return text.toUtf8();
}





QJsonObject LenientJson::parseObject(const QByteArray & aText)
{
	QJsonParseError err;
	auto doc = QJsonDocument::fromJson(normalize(aText), &err);
	if (err.error != QJsonParseError::NoError)
	{
		throw ParseError("Cannot parse the response as JSON at offset %1: %2", err.offset, err.errorString());
	}
	if (!doc.isObject())
	{
		throw ParseError("The response is not a JSON object");
	}
	return doc.object();
}

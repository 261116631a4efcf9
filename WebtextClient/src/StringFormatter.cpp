#include "StringFormatter.hpp"





QString StringFormatter::substitute(const QString & aFormatString, const QStringList & aArgs)
{
	QString res;
	res.reserve(aFormatString.size() + aArgs.size() * 8);
	const auto len = aFormatString.size();
	for (int i = 0; i < len; ++i)
	{
		auto ch = aFormatString[i];
		if ((ch != '%') || (i + 1 >= len) || !aFormatString[i + 1].isDigit())
		{
			res.append(ch);
			continue;
		}

		// Parse the (possibly multi-digit) argument number:
		int argNum = 0;
		int end = i + 1;
		while ((end < len) && aFormatString[end].isDigit())
		{
			argNum = argNum * 10 + aFormatString[end].digitValue();
			end += 1;
		}
		if ((argNum < 1) || (argNum > aArgs.size()))
		{
			// Not a valid argument reference, output verbatim:
			res.append(aFormatString.mid(i, end - i));
		}
		else
		{
			res.append(aArgs[argNum - 1]);
		}
		i = end - 1;
	}
	return res;
}

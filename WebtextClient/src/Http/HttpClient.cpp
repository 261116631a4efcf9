#include "HttpClient.hpp"





QByteArray HttpClient::encodeForm(const Form & aForm)
{
	QByteArray res;
	for (const auto & item: aForm)
	{
		if (!res.isEmpty())
		{
			res.append('&');
		}
		res.append(QUrl::toPercentEncoding(item.first));
		res.append('=');
		res.append(QUrl::toPercentEncoding(item.second));
	}
	return res;
}





QUrl HttpClient::withQuery(const QUrl & aUrl, const Form & aQuery)
{
	QUrl res(aUrl);
	res.setQuery(QString::fromLatin1(encodeForm(aQuery)), QUrl::StrictMode);
	return res;
}

#include "NetworkSessionFactory.hpp"
#include "../ComponentCollection.hpp"
#include "../DB/CookieCache.hpp"
#include "../Http/QtHttpClient.hpp"
#include "MeteorSession.hpp"
#include "O2Session.hpp"
#include "ThreeSession.hpp"
#include "TescoSession.hpp"
#include "VodafoneSession.hpp"





NetworkSessionFactory::NetworkSessionFactory(ComponentCollection & aComponents, int aTimeoutMsec):
	mComponents(aComponents),
	mTimeoutMsec(aTimeoutMsec)
{
}





CarrierSessionPtr NetworkSessionFactory::createSession(CarrierKind aKind, bool aUseCookieCache)
{
	std::shared_ptr<CookieCache> cookieCache;
	if (aUseCookieCache && mComponents.has<CookieCache>())
	{
		cookieCache = mComponents.get<CookieCache>();
	}
	return createSessionForClient(
		aKind,
		std::make_unique<QtHttpClient>(mComponents.logger("Http"), mTimeoutMsec),
		mComponents.logger(carrierName(aKind)),
		cookieCache
	);
}





CarrierSessionPtr NetworkSessionFactory::createSessionForClient(
	CarrierKind aKind,
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
)
{
	switch (aKind)
	{
		case crMeteor:   return std::make_unique<MeteorSession>  (std::move(aHttpClient), aLogger, std::move(aCookieCache));
		case crO2:       return std::make_unique<O2Session>      (std::move(aHttpClient), aLogger, std::move(aCookieCache));
		case crVodafone: return std::make_unique<VodafoneSession>(std::move(aHttpClient), aLogger, std::move(aCookieCache));
		case crThree:    return std::make_unique<ThreeSession>   (std::move(aHttpClient), aLogger, std::move(aCookieCache));
		case crEmobile:  return std::make_unique<EmobileSession> (std::move(aHttpClient), aLogger, std::move(aCookieCache));
		case crTesco:    return std::make_unique<TescoSession>   (std::move(aHttpClient), aLogger, std::move(aCookieCache));
	}
	throw LogicError("Unhandled carrier kind: %1", static_cast<int>(aKind));
}

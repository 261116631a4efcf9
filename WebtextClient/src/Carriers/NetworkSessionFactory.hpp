#pragma once

#include "CarrierSession.hpp"





// fwd:
class ComponentCollection;
class CookieCache;
class HttpClient;
class Logger;





/** Creates the carrier sessions that talk to the real carriers' sites over the network, using QtHttpClient.
Each session gets its own HTTP client (and thus its own cookie jar), the carrier's logger from the MultiLogger
and, if requested, the CookieCache component. */
class NetworkSessionFactory:
	public CarrierSessionFactory
{
public:

	/** Creates a factory whose sessions' requests time out after aTimeoutMsec. */
	NetworkSessionFactory(ComponentCollection & aComponents, int aTimeoutMsec);

	// CarrierSessionFactory override:
	virtual CarrierSessionPtr createSession(CarrierKind aKind, bool aUseCookieCache) override;

	/** Creates the CarrierSession implementation for the specified carrier, using the specified HTTP client.
	aCookieCache may be nullptr. */
	static CarrierSessionPtr createSessionForClient(
		CarrierKind aKind,
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);


protected:

	/** The components from which the loggers and the cookie cache are taken. */
	ComponentCollection & mComponents;

	/** The per-request timeout given to the HTTP clients. */
	int mTimeoutMsec;
};

#include <gtest/gtest.h>
#include "../src/Carriers/MeteorSession.hpp"
#include "../src/Carriers/NetworkSessionFactory.hpp"
#include "../src/Carriers/O2Session.hpp"
#include "../src/Carriers/TescoSession.hpp"
#include "../src/Carriers/ThreeSession.hpp"
#include "../src/Carriers/VodafoneSession.hpp"
#include "FakeHttpClient.hpp"
#include "TestHelpers.hpp"





/** Fixture providing the scripted HTTP client and a logger for the carrier sessions. */
class CarrierSessionTest:
	public ::testing::Test
{
protected:

	FakeHttpScriptPtr mScript = std::make_shared<FakeHttpScript>();
	TestLogger mLogger;


	/** Creates a session of the specified class that uses mScript, without a cookie cache. */
	template <typename SessionClass>
	std::unique_ptr<SessionClass> create()
	{
		return std::make_unique<SessionClass>(std::make_unique<FakeHttpClient>(mScript), mLogger.logger(), nullptr);
	}

	/** Returns the SendError kind thrown by aFn, fails the test if no SendError is thrown. */
	template <typename Fn>
	static SendError::Kind sendErrorKind(Fn aFn)
	{
		try
		{
			aFn();
		}
		catch (const SendError & exc)
		{
			return exc.kind();
		}
		ADD_FAILURE() << "Expected a SendError";
		return SendError::skCancelled;
	}
};

static const MessageChunk HI{1, 1, "hi"};





////////////////////////////////////////////////////////////////////////////////
// Meteor:

static const char * METEOR_LOGIN = "https://www.mymeteor.ie/go/mymeteor-login-manager";
static const char * METEOR_LANDING = "https://www.mymeteor.ie/postpaylanding";
static const char * METEOR_API = "https://www.mymeteor.ie/mymeteorapi/index.cfm";

TEST_F(CarrierSessionTest, MeteorLogin)
{
	mScript->respond("POST", METEOR_LOGIN, "<html>Welcome</html>", METEOR_LANDING, 200,
		{FakeHttpScript::sessionCookie("JSESSIONID", "abc")}
	);
	auto session = create<MeteorSession>();
	EXPECT_EQ(session->kind(), crMeteor);
	EXPECT_EQ(session->maxMessageLength(), 480);
	session->authenticate("0861234567", "1234");
	ASSERT_EQ(mScript->mRequests.size(), 1u);
	const auto & req = mScript->mRequests[0];
	EXPECT_EQ(req.field("username"), "0861234567");
	EXPECT_EQ(req.field("userpass"), "1234");
	EXPECT_EQ(req.field("returnTo"), "/");
	EXPECT_TRUE(mScript->mSteps.empty());
}





TEST_F(CarrierSessionTest, MeteorLoginRejected)
{
	mScript->respond("POST", METEOR_LOGIN, "<html>Wrong password</html>", METEOR_LOGIN);
	auto session = create<MeteorSession>();
	EXPECT_THROW(session->authenticate("0861234567", "bad"), CarrierSession::AuthError);
}





TEST_F(CarrierSessionTest, MeteorLoginNetworkFailure)
{
	mScript->fail("POST", METEOR_LOGIN);
	auto session = create<MeteorSession>();
	EXPECT_THROW(session->authenticate("0861234567", "1234"), CarrierSession::AuthError);

	mScript->respond("POST", METEOR_LOGIN, "Internal error", QString(), 500);
	EXPECT_THROW(session->authenticate("0861234567", "1234"), CarrierSession::AuthError);
}





TEST_F(CarrierSessionTest, MeteorSend)
{
	mScript->respond("POST", METEOR_LOGIN, "", METEOR_LANDING);
	mScript->respond("GET", METEOR_API, "addedMsisdn");
	mScript->respond("GET", METEOR_API, "<script>showEl(\"sentTrue\");</script>");
	auto session = create<MeteorSession>();
	session->authenticate("0861234567", "1234");
	session->sendChunk("0865551234", MessageChunk{2, 3, "hello "});
	ASSERT_EQ(mScript->mRequests.size(), 3u);
	EXPECT_EQ(mScript->mRequests[1].field("func"), "addEnteredMsisdns");
	EXPECT_EQ(mScript->mRequests[1].field("add"), "0|0865551234");
	EXPECT_EQ(mScript->mRequests[2].field("func"), "sendSMS");
	EXPECT_EQ(mScript->mRequests[2].field("messageText"), "hello (2/3)");
}





TEST_F(CarrierSessionTest, MeteorSendFailures)
{
	mScript->respond("POST", METEOR_LOGIN, "", METEOR_LANDING);
	auto session = create<MeteorSession>();
	session->authenticate("0861234567", "1234");

	// No success indicator:
	mScript->respond("GET", METEOR_API, "added");
	mScript->respond("GET", METEOR_API, "showEl(\"sentFalse\")");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0865551234", HI); }), SendError::skUnexpectedResponse);

	// Timeout:
	mScript->fail("GET", METEOR_API, true);
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0865551234", HI); }), SendError::skTimeout);

	// Transport failure:
	mScript->fail("GET", METEOR_API, false);
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0865551234", HI); }), SendError::skTransport);

	// HTTP error:
	mScript->respond("GET", METEOR_API, "Oops", QString(), 503);
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0865551234", HI); }), SendError::skTransport);
}





TEST_F(CarrierSessionTest, MeteorSessionExpiry)
{
	mScript->respond("POST", METEOR_LOGIN, "", METEOR_LANDING);
	auto session = create<MeteorSession>();
	session->authenticate("0861234567", "1234");

	// Redirected to the login page:
	mScript->respond("GET", METEOR_API, "<form>login</form>", METEOR_LOGIN);
	EXPECT_THROW(session->sendChunk("0865551234", HI), CarrierSession::AuthError);

	// HTTP 403:
	mScript->respond("GET", METEOR_API, "Forbidden", QString(), 403);
	EXPECT_THROW(session->sendChunk("0865551234", HI), CarrierSession::AuthError);
}





TEST_F(CarrierSessionTest, MeteorNumbers)
{
	auto session = create<MeteorSession>();
	EXPECT_EQ(session->normalizeNumber("+353 86 555 1234"), "0865551234");
	EXPECT_EQ(session->normalizeNumber("00353865551234"), "0865551234");
	EXPECT_EQ(session->normalizeNumber("086-555-1234"), "0865551234");
	EXPECT_EQ(sendErrorKind([&](){ session->normalizeNumber("0165551234"); }), SendError::skRejectedNumber);
	EXPECT_EQ(sendErrorKind([&](){ session->normalizeNumber("+44865551234"); }), SendError::skRejectedNumber);
	EXPECT_EQ(sendErrorKind([&](){ session->normalizeNumber("mum"); }), SendError::skRejectedNumber);
	EXPECT_TRUE(mScript->mRequests.empty());
}





TEST_F(CarrierSessionTest, MeteorTextsRemaining)
{
	auto session = create<MeteorSession>();
	mScript->respond("GET", "https://www.mymeteor.ie/go/freewebtext",
		"<p>Free web texts left <input type=\"text\" id=\"numfreesmstext\" value=\"42\" disabled size=2></p>"
	);
	EXPECT_EQ(session->textsRemaining(), 42);

	mScript->respond("GET", "https://www.mymeteor.ie/go/freewebtext", "<p>Redesigned page</p>");
	EXPECT_EQ(session->textsRemaining(), CarrierSession::UNKNOWN_TEXTS_REMAINING);

	mScript->fail("GET", "https://www.mymeteor.ie/go/freewebtext");
	EXPECT_EQ(session->textsRemaining(), CarrierSession::UNKNOWN_TEXTS_REMAINING);
}





TEST_F(CarrierSessionTest, EmobileUsesOwnPortal)
{
	mScript->respond("POST", "https://myaccount.emobile.ie/", "", "https://myaccount.emobile.ie/go/myaccount");
	mScript->respond("GET", "https://myaccount.emobile.ie/", "");
	mScript->respond("GET", "https://myaccount.emobile.ie/", "showEl(\"sentTrue\")");
	auto session = create<EmobileSession>();
	EXPECT_EQ(session->kind(), crEmobile);
	session->authenticate("0831234567", "1234");
	session->sendChunk(session->normalizeNumber("+353831112222"), HI);
	EXPECT_EQ(mScript->mRequests[1].field("add"), "0|0831112222");
}





////////////////////////////////////////////////////////////////////////////////
// Three:

static const char * THREE_LOGIN = "https://webtexts.three.ie/webtext/users/login";
static const char * THREE_SEND = "https://webtexts.three.ie/webtext/messages/send";

TEST_F(CarrierSessionTest, ThreeLoginAndSend)
{
	mScript->respond("POST", THREE_LOGIN, "", THREE_SEND);
	mScript->respond("GET", THREE_SEND, "<div>Remaining texts: <b>12 (of 300)</b></div>");
	mScript->respond("POST", THREE_SEND, "<div class=\"flash\">Message sent to 1 recipient</div>");
	auto session = create<ThreeSession>();
	session->authenticate("0831234567", "9999");
	EXPECT_EQ(mScript->mRequests[0].field("data[User][telephoneNo]"), "0831234567");
	EXPECT_EQ(mScript->mRequests[0].field("data[User][pin]"), "9999");
	EXPECT_EQ(session->textsRemaining(), 12);
	session->sendChunk("+447700900123", HI);
	EXPECT_EQ(mScript->mRequests[2].field("data[Message][message]"), "hi");
	EXPECT_EQ(mScript->mRequests[2].field("data[Message][recipients_individual]"), "+447700900123");

	// The default number normalization accepts any valid number:
	EXPECT_EQ(session->normalizeNumber("+44 7700 900123"), "+447700900123");
}





TEST_F(CarrierSessionTest, ThreeFailures)
{
	mScript->respond("POST", THREE_LOGIN, "", THREE_LOGIN);
	auto session = create<ThreeSession>();
	EXPECT_THROW(session->authenticate("0831234567", "0000"), CarrierSession::AuthError);

	mScript->respond("POST", THREE_LOGIN, "", THREE_SEND);
	session->authenticate("0831234567", "9999");
	mScript->respond("POST", THREE_SEND, "<div>Something went wrong</div>");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0861234567", HI); }), SendError::skUnexpectedResponse);
	mScript->respond("POST", THREE_SEND, "", THREE_LOGIN);
	EXPECT_THROW(session->sendChunk("0861234567", HI), CarrierSession::AuthError);
}





////////////////////////////////////////////////////////////////////////////////
// O2:

static const char * O2_LOGIN = "https://www.o2online.ie/amserver/UI/Login";
static const char * O2_LOGIN_CHECK = "http://www.o2online.ie/wps/wcm/connect/O2/Logged+in/LoginCheck";
static const char * O2_SSO = "http://messaging.o2online.ie/ssomanager.osp";
static const char * O2_SEND = "http://messaging.o2online.ie/smscenter_send.osp";

TEST_F(CarrierSessionTest, O2LoginAndSend)
{
	mScript->respond("POST", O2_LOGIN, "", O2_LOGIN_CHECK);
	mScript->respond("GET", O2_SSO,
		"<script>location.href='o2om_smscenter_new.osp?MsgContentID=-1&SID=_&SID=4711abc';</script>"
	);
	mScript->respond("POST", "http://messaging.o2online.ie/smscenter_evaluate.osp", "{ freeMessageCount : 249 * 1, isSuccess : true }");
	mScript->respond("POST", O2_SEND, "{isSuccess : true, // ok\n msg: 'sent'}");
	auto session = create<O2Session>();
	session->authenticate("joe@example.com", "secret");
	EXPECT_EQ(session->sid(), "4711abc");
	const auto & login = mScript->mRequests[0];
	EXPECT_EQ(login.field("IDToken1"), "joe@example.com");
	EXPECT_EQ(login.field("IDToken2"), "secret");
	EXPECT_EQ(login.field("org"), "o2ext");
	ASSERT_EQ(login.mHeaders.count("Referer"), 1u);

	EXPECT_EQ(session->textsRemaining(), 249);
	session->sendChunk("0861234567", HI);
	EXPECT_EQ(mScript->mRequests[3].field("SID"), "4711abc");
	EXPECT_EQ(mScript->mRequests[3].field("SMSTo"), "0861234567");
	EXPECT_EQ(mScript->mRequests[3].field("SMSText"), "hi");
}





TEST_F(CarrierSessionTest, O2Failures)
{
	// Login OK, but no SID:
	mScript->respond("POST", O2_LOGIN, "", O2_LOGIN_CHECK);
	mScript->respond("GET", O2_SSO, "<html>Service unavailable</html>");
	auto session = create<O2Session>();
	EXPECT_THROW(session->authenticate("joe@example.com", "secret"), CarrierSession::AuthError);

	mScript->respond("POST", O2_LOGIN, "", O2_LOGIN_CHECK);
	mScript->respond("GET", O2_SSO, "o2om_smscenter_new.osp?MsgContentID=-1&SID=_&SID=42");
	session->authenticate("joe@example.com", "secret");

	mScript->respond("POST", O2_SEND, "{isSuccess: false}");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0861234567", HI); }), SendError::skUnexpectedResponse);
	mScript->respond("POST", O2_SEND, "<html>Login</html>", O2_LOGIN);
	EXPECT_THROW(session->sendChunk("0861234567", HI), CarrierSession::AuthError);
	EXPECT_FALSE(session->detectSuccess("not json at all"));
}





////////////////////////////////////////////////////////////////////////////////
// Vodafone:

static const char * VODAFONE_LOGIN = "https://www.vodafone.ie/myv/services/login/Login.shtml";
static const char * VODAFONE_FORM = "https://www.vodafone.ie/myv/messaging/webtext/index.jsp";
static const char * VODAFONE_SEND = "https://www.vodafone.ie/myv/messaging/webtext/Process.shtml";
static const char * VODAFONE_FORM_PAGE =
	"<form><input type=\"hidden\" name=\"org.apache.struts.taglib.html.TOKEN\" value=\"f00d\">"
	"<p>You have 250 free texts remaining</p></form>";

TEST_F(CarrierSessionTest, VodafoneSend)
{
	mScript->respond("POST", VODAFONE_LOGIN, "", "https://www.vodafone.ie/myv/index.jsp");
	mScript->respond("GET", VODAFONE_FORM, VODAFONE_FORM_PAGE);
	mScript->respond("GET", VODAFONE_FORM, VODAFONE_FORM_PAGE);
	mScript->respond("POST", VODAFONE_SEND, "<p>Message sent!</p>");
	auto session = create<VodafoneSession>();
	session->authenticate("0871234567", "pw");
	EXPECT_EQ(session->textsRemaining(), 250);
	session->sendChunk("0861234567", HI);
	EXPECT_EQ(mScript->mRequests[3].field("org.apache.struts.taglib.html.TOKEN"), "f00d");
	EXPECT_EQ(mScript->mRequests[3].field("recipients[0]"), "0861234567");
	EXPECT_EQ(mScript->mRequests[3].field("message"), "hi");
}





TEST_F(CarrierSessionTest, VodafoneFailures)
{
	mScript->respond("POST", VODAFONE_LOGIN, "", "https://www.vodafone.ie/myv/index.jsp");
	auto session = create<VodafoneSession>();
	session->authenticate("0871234567", "pw");

	mScript->respond("GET", VODAFONE_FORM, VODAFONE_FORM_PAGE);
	mScript->respond("POST", VODAFONE_SEND, "<p>0861234567 is not a valid Irish mobile number</p>");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0861234567", HI); }), SendError::skRejectedNumber);

	mScript->respond("GET", VODAFONE_FORM, "", VODAFONE_LOGIN);
	EXPECT_THROW(session->sendChunk("0861234567", HI), CarrierSession::AuthError);

	mScript->respond("GET", VODAFONE_FORM, "<form>No token here</form>");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0861234567", HI); }), SendError::skUnexpectedResponse);
}





////////////////////////////////////////////////////////////////////////////////
// Tesco:

static const char * TESCO_LOGIN = "https://www.tescomobile.ie/login";
static const char * TESCO_FORM = "https://www.tescomobile.ie/myaccount/webtext";
static const char * TESCO_SEND = "https://www.tescomobile.ie/myaccount/webtext/send";

TEST_F(CarrierSessionTest, TescoLoginAndSend)
{
	mScript->respond("GET", TESCO_LOGIN, "<input type=\"hidden\" name=\"_csrf\" value=\"tok-1\"/>");
	mScript->respond("POST", TESCO_LOGIN, "", "https://www.tescomobile.ie/myaccount");
	mScript->respond("GET", TESCO_FORM, "<input type=\"hidden\" name=\"_csrf\" value=\"tok-2\"/>");
	mScript->respond("POST", TESCO_SEND, "{\"status\": \"OK\"}");
	auto session = create<TescoSession>();
	EXPECT_EQ(session->maxMessageLength(), 160);
	session->authenticate("0891234567", "pw");
	EXPECT_EQ(mScript->mRequests[1].field("_csrf"), "tok-1");
	session->sendChunk("0861234567", HI);
	EXPECT_EQ(mScript->mRequests[3].field("_csrf"), "tok-2");
	EXPECT_EQ(mScript->mRequests[3].field("recipient"), "0861234567");
}





TEST_F(CarrierSessionTest, TescoFailures)
{
	mScript->respond("GET", TESCO_LOGIN, "<p>No form</p>");
	auto session = create<TescoSession>();
	EXPECT_THROW(session->authenticate("0891234567", "pw"), CarrierSession::AuthError);

	mScript->respond("GET", TESCO_LOGIN, "<input type=\"hidden\" name=\"_csrf\" value=\"t\"/>");
	mScript->respond("POST", TESCO_LOGIN, "", "https://www.tescomobile.ie/myaccount");
	session->authenticate("0891234567", "pw");

	mScript->respond("GET", TESCO_FORM, "<input type=\"hidden\" name=\"_csrf\" value=\"t\"/>");
	mScript->respond("POST", TESCO_SEND, "{\"status\": \"ERROR\", \"code\": \"INVALID_NUMBER\"}");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0861234567", HI); }), SendError::skRejectedNumber);

	mScript->respond("GET", TESCO_FORM, "<input type=\"hidden\" name=\"_csrf\" value=\"t\"/>");
	mScript->respond("POST", TESCO_SEND, "{\"status\": \"ERROR\"}");
	EXPECT_EQ(sendErrorKind([&](){ session->sendChunk("0861234567", HI); }), SendError::skUnexpectedResponse);

	mScript->respond("GET", TESCO_FORM, "", TESCO_LOGIN);
	EXPECT_THROW(session->sendChunk("0861234567", HI), CarrierSession::AuthError);
}





////////////////////////////////////////////////////////////////////////////////
// NetworkSessionFactory:

TEST_F(CarrierSessionTest, FactoryCreatesEachCarrier)
{
	for (auto kind: allCarrierKinds())
	{
		auto session = NetworkSessionFactory::createSessionForClient(
			kind, std::make_unique<FakeHttpClient>(mScript), mLogger.logger(), nullptr
		);
		ASSERT_NE(session, nullptr);
		EXPECT_EQ(session->kind(), kind);
	}
}

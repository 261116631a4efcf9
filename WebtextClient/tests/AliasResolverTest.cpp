#include <gtest/gtest.h>
#include "../src/Sms/AliasResolver.hpp"
#include "../src/Sms/PhoneNumber.hpp"
#include "TestHelpers.hpp"





static AliasTable makeTable()
{
	AliasTable res;
	res.addAlias("sean", {"0865551234"});
	res.addAlias("beerpeople", {"0861111111", "0862222222", "0863333333"});
	res.addAlias("Alice", {"+353871234567"});
	return res;
}





TEST(PhoneNumber, StripsSeparators)
{
	EXPECT_EQ(PhoneNumber::canonical("086 555-12.34"), "0865551234");
	EXPECT_EQ(PhoneNumber::canonical("+353 86 5551234"), "+353865551234");
	EXPECT_TRUE(PhoneNumber::canonical("08655512a4").isEmpty());
	EXPECT_TRUE(PhoneNumber::canonical("08+65551234").isEmpty());
	EXPECT_FALSE(PhoneNumber::isValid(""));
}





TEST(PhoneNumber, IrishNumbers)
{
	EXPECT_EQ(PhoneNumber::irishToNational("+353865551234"), "0865551234");
	EXPECT_EQ(PhoneNumber::irishToNational("00353865551234"), "0865551234");
	EXPECT_EQ(PhoneNumber::irishToNational("+44865551234"), "+44865551234");
	EXPECT_TRUE(PhoneNumber::isIrishMobile("0865551234"));
	EXPECT_FALSE(PhoneNumber::isIrishMobile("0165551234"));
	EXPECT_FALSE(PhoneNumber::isIrishMobile("086555123"));
}





TEST(AliasResolver, NumberIsReturnedUnchanged)
{
	auto table = makeTable();
	EXPECT_EQ(AliasResolver::resolve("0869998888", table), QStringList{"0869998888"});
	EXPECT_EQ(AliasResolver::resolve("+353 86 999-8888", table), QStringList{"+353869998888"});
}





TEST(AliasResolver, AliasReturnsStoredNumbersInOrder)
{
	auto table = makeTable();
	EXPECT_EQ(AliasResolver::resolve("sean", table), QStringList{"0865551234"});
	QStringList expected{"0861111111", "0862222222", "0863333333"};
	EXPECT_EQ(AliasResolver::resolve("beerpeople", table), expected);
}





TEST(AliasResolver, UnknownAliasListsKnownOnesSorted)
{
	auto table = makeTable();
	try
	{
		AliasResolver::resolve("bob", table);
		FAIL() << "Expected an UnknownRecipientError";
	}
	catch (const UnknownRecipientError & exc)
	{
		EXPECT_EQ(exc.token(), "bob");
		EXPECT_EQ(exc.message(), "Alias bob unknown. Known aliases: Alice, beerpeople, sean");
	}
}





TEST(AliasResolver, ResolveAllKeepsDuplicates)
{
	auto table = makeTable();
	auto numbers = AliasResolver::resolveAll({"sean", "beerpeople", "0865551234"}, table);
	QStringList expected{"0865551234", "0861111111", "0862222222", "0863333333", "0865551234"};
	EXPECT_EQ(numbers, expected);
	EXPECT_THROW(AliasResolver::resolveAll({"sean", "nobody"}, table), UnknownRecipientError);
}





TEST(AliasTable, RejectsDuplicateNames)
{
	auto table = makeTable();
	EXPECT_THROW(table.addAlias("sean", {"0861234567"}), LogicError);
	EXPECT_THROW(table.addAlias("empty", {}), LogicError);
	EXPECT_TRUE(table.containsNumber("0862222222"));
	EXPECT_FALSE(table.containsNumber("0869999999"));
	EXPECT_EQ(table.size(), 3u);
}

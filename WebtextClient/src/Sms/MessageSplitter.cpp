#include "MessageSplitter.hpp"
#include <algorithm>





const int MessageSplitter::WHITESPACE_LOOKBACK;





////////////////////////////////////////////////////////////////////////////////
// MessageChunk:

QString MessageChunk::renderedText() const
{
	if (mTotal <= 1)
	{
		return rightTrimmed(mText);
	}
	return QString("%1 (%2/%3)").arg(mText.trimmed()).arg(mIndex).arg(mTotal);
}





QString MessageChunk::rightTrimmed(const QString & aText)
{
	auto end = aText.size();
	while ((end > 0) && aText[end - 1].isSpace())
	{
		end -= 1;
	}
	return aText.left(end);
}





////////////////////////////////////////////////////////////////////////////////
// MessageSplitter::MessageTooLongError:

MessageSplitter::MessageTooLongError::MessageTooLongError(int aLength, int aMaxLength, bool aIsSplitAllowed):
	Super(aIsSplitAllowed ?
		"Message is %1 chars, the carrier's limit of %2 chars is too small for splitting it" :
		"Message is %1 chars, the carrier allows at most %2 chars and splitting is disabled",
		aLength, aMaxLength
	),
	mLength(aLength),
	mMaxLength(aMaxLength)
{
}





////////////////////////////////////////////////////////////////////////////////
// MessageSplitter:

MessageChunks MessageSplitter::split(const QString & aBody, int aMaxLength, bool aIsSplitAllowed)
{
	const int len = aBody.size();
	if (len <= aMaxLength)
	{
		return {MessageChunk{1, 1, aBody}};
	}
	if (!aIsSplitAllowed)
	{
		throw MessageTooLongError(len, aMaxLength, false);
	}

	// Find the least total for which the slices fit, together with the indicator, into the limit.
	// The indicator gets longer with more digits in total, so the slice capacity shrinks as total grows:
	int total = 2;
	while (true)
	{
		auto capacity = aMaxLength - indicatorLength(total, total);
		if (capacity < 1)
		{
			throw MessageTooLongError(len, aMaxLength, true);
		}
		auto slices = partition(aBody, capacity);
		auto numSlices = static_cast<int>(slices.size());
		if (numSlices == 1)
		{
			// Only whitespace was over the limit, the message is sent whole, without the trailing whitespace:
			if (MessageChunk::rightTrimmed(aBody).size() > aMaxLength)
			{
				throw MessageTooLongError(len, aMaxLength, true);
			}
			return {MessageChunk{1, 1, aBody}};
		}
		if (numSlices <= total)
		{
			MessageChunks res;
			res.reserve(slices.size());
			for (int i = 0; i < numSlices; ++i)
			{
				res.push_back(MessageChunk{i + 1, numSlices, slices[static_cast<size_t>(i)]});
			}
			return res;
		}
		total = numSlices;
	}
}





int MessageSplitter::indicatorLength(int aIndex, int aTotal)
{
	// " (" + index + "/" + total + ")"
	return 4 + QString::number(aIndex).size() + QString::number(aTotal).size();
}





std::vector<QString> MessageSplitter::partition(const QString & aBody, int aCapacity)
{
	std::vector<QString> res;
	const int len = aBody.size();
	int start = 0;
	QString leadingWhitespace;
	while (start < len)
	{
		auto end = sliceEnd(aBody, start, aCapacity);
		auto slice = aBody.mid(start, end - start);
		start = end;

		// A whitespace-only slice would be sent as a bare part indicator, join it to a neighbor instead.
		// Rendering trims it away again, so the neighbor still fits:
		if (slice.trimmed().isEmpty())
		{
			if (res.empty())
			{
				leadingWhitespace.append(slice);
			}
			else
			{
				res.back().append(slice);
			}
			continue;
		}
		res.push_back(leadingWhitespace + slice);
		leadingWhitespace.clear();
	}
	if (!leadingWhitespace.isEmpty())
	{
		// The whole body is whitespace:
		res.push_back(leadingWhitespace);
	}
	return res;
}





int MessageSplitter::sliceEnd(const QString & aBody, int aStart, int aCapacity)
{
	const int len = aBody.size();
	auto limit = aStart + aCapacity;
	if (limit >= len)
	{
		return len;
	}

	// If the limit itself is on a word boundary, use it:
	if (aBody[limit].isSpace())
	{
		return limit;
	}

	// Search back for the nearest whitespace, the whitespace stays with this slice:
	auto lookbackStart = std::max(aStart + 1, limit - WHITESPACE_LOOKBACK);
	for (int i = limit - 1; i >= lookbackStart; --i)
	{
		if (aBody[i].isSpace())
		{
			return i + 1;
		}
	}

	// No whitespace nearby, hard cut, but don't split a surrogate pair:
	if (
		(limit - 1 > aStart) &&
		aBody[limit - 1].isHighSurrogate() &&
		aBody[limit].isLowSurrogate()
	)
	{
		return limit - 1;
	}
	return limit;
}

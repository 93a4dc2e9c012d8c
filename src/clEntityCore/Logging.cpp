
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "Logging.h"

#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <map>
#include <vector>


namespace
{
	//
	// Base stream class
	//
	struct Stream
	{
		Stream() : next(0) { }

		virtual ~Stream() { }

		// Implementation required by base classes to do what they want with the text
		virtual void Log(const char* text) = 0;

		// Forward linked list of streams
		Stream* next;
	};


	struct StdoutStream : public Stream
	{
		void Log(const char* text)
		{
			// Doesn't append the '\n'
			fputs(text, stdout);
		}
	};


	struct FileStream : public Stream
	{
		FileStream(const std::string& f)
			: filename(f)
			, fp(0)
		{
		}

		~FileStream()
		{
			if (fp != 0)
				fclose(fp);
		}

		void Log(const char* text)
		{
			// Opened lazily in append mode as the creating call has already truncated it
			if (fp == 0)
				fp = fopen(filename.c_str(), "a");

			// Flush the file for each write, trying to prevent missing log data
			if (fp != 0)
			{
				fputs(text, fp);
				fflush(fp);
			}
		}

		std::string filename;
		FILE* fp;
	};


	// Named in-memory capture buffers
	typedef std::map<std::string, std::string> BufferMap;
	BufferMap g_Buffers;


	struct BufferStream : public Stream
	{
		BufferStream(const std::string& n)
			: name(n)
		{
		}

		void Log(const char* text)
		{
			g_Buffers[name] += text;
		}

		std::string name;
	};


	//
	// Number of bits, excluding sign
	//
	const int NB_TAG_BITS = sizeof(logging::Tag) * 8 - 1;


	//
	// Container for a set of streams linked to a name, one list per tag bit
	//
	struct StreamSet
	{
		StreamSet()
			: indent_depth(0)
			, streams(NB_TAG_BITS, (Stream*)0)
		{
		}

		int indent_depth;
		std::vector<Stream*> streams;
	};


	//
	// The stream map allows each tag to have its own unique set of streams, per name.
	//
	// stream name -> [ 0 ] stream(0) -> stream(1) ...
	//                [ 1 ] ^...
	//                 ...
	//                [ N ]
	//
	// Keyed by string contents as the same name literal can have different addresses
	// in different translation units. std::map never moves its nodes so handles stay valid.
	//
	typedef std::map<std::string, StreamSet> StreamMap;
	StreamMap& GetStreamMap()
	{
		static StreamMap stream_map;
		return stream_map;
	}


	void DeleteAllStreams()
	{
		StreamMap& stream_map = GetStreamMap();
		for (StreamMap::iterator i = stream_map.begin(); i != stream_map.end(); ++i)
		{
			for (int j = 0; j < NB_TAG_BITS; j++)
			{
				// Delete everything in the linked list
				while (Stream* stream = i->second.streams[j])
				{
					i->second.streams[j] = stream->next;
					delete stream;
				}
			}
		}
	}


	template <typename STREAM_TYPE>
	void SetLogToStream(const char* name, logging::Tag tag, const STREAM_TYPE& copy)
	{
		// Ensure all streams are deleted on shutdown
		static bool registered = false;
		if (!registered)
		{
			atexit(DeleteAllStreams);
			registered = true;
		}

		// Iterate over every set tag
		for (int i = 0; i < NB_TAG_BITS; i++)
		{
			int mask = 1 << i;
			if (tag & mask)
			{
				// Link the newly allocated copy into the forward linked list
				std::vector<Stream*>& streams = GetStreamMap()[name].streams;
				STREAM_TYPE* stream = new STREAM_TYPE(copy);
				stream->next = streams[i];
				streams[i] = stream;
			}
		}
	}


	int TagIndex(logging::Tag tag)
	{
		// Index of the highest set bit
		int index = -1;
		for (unsigned int v = tag; v != 0; v >>= 1)
			index++;
		return index;
	}


	std::string FormatText(const char* format, va_list args)
	{
		// Try a local buffer first, falling back to the heap for long lines
		char buffer[512];
		va_list args_copy;
		va_copy(args_copy, args);
		int length = vsnprintf(buffer, sizeof(buffer), format, args_copy);
		va_end(args_copy);
		if (length < 0)
			return std::string();
		if (length < (int)sizeof(buffer))
			return std::string(buffer, length);

		std::vector<char> big_buffer(length + 1);
		vsnprintf(&big_buffer[0], big_buffer.size(), format, args);
		return std::string(&big_buffer[0], length);
	}
}


void logging::SetLogToStdout(const char* name, Tag tag)
{
	SetLogToStream(name, tag, StdoutStream());
}


void logging::SetLogToFile(const char* name, Tag tag, const char* filename)
{
	// Open the file for writing, destroying older writes
	FILE* fp = fopen(filename, "w");
	if (fp)
	{
		fclose(fp);
	}

	SetLogToStream(name, tag, FileStream(filename));
}


void logging::SetLogToBuffer(const char* name, Tag tag)
{
	// Only one buffer per name and tag, so repeated calls don't duplicate captured text
	std::vector<Stream*>& streams = GetStreamMap()[name].streams;
	int new_tags = 0;
	for (int i = 0; i < NB_TAG_BITS; i++)
	{
		int mask = 1 << i;
		if ((tag & mask) == 0)
			continue;

		bool found = false;
		for (Stream* stream = streams[i]; stream != 0; stream = stream->next)
		{
			if (dynamic_cast<BufferStream*>(stream) != 0)
				found = true;
		}
		if (!found)
			new_tags |= mask;
	}

	if (new_tags != 0)
		SetLogToStream(name, (Tag)new_tags, BufferStream(name));
}


const std::string& logging::GetBuffer(const char* name)
{
	return g_Buffers[name];
}


void logging::ClearBuffer(const char* name)
{
	g_Buffers[name].clear();
}


logging::StreamHandle logging::GetStreamHandle(const char* name)
{
	return &GetStreamMap()[name];
}


void logging::Log(StreamHandle handle, Tag tag, bool do_prefix, const char* format, ...)
{
	StreamSet* stream_set = (StreamSet*)handle;

	// Leave early if nobody is listening
	int index = TagIndex(tag);
	if (index < 0 || index >= NB_TAG_BITS)
		return;
	Stream* stream = stream_set->streams[index];
	if (stream == 0)
		return;

	va_list args;
	va_start(args, format);
	std::string text = FormatText(format, args);
	va_end(args);

	std::string prefix;
	if (do_prefix)
	{
		// Kick the prefix off with indent characters
		if (tag == TAG_INFO)
			prefix.assign(stream_set->indent_depth > 0 ? stream_set->indent_depth : 0, '\t');

		// Add any tag annotations
		switch (tag)
		{
		case (TAG_WARNING): prefix += "WARNING: "; break;
		case (TAG_ERROR): prefix += "ERROR: "; break;
		default: break;
		}
	}

	// Iterate over every log output
	while (stream)
	{
		if (do_prefix)
		{
			stream->Log(prefix.c_str());
		}
		stream->Log(text.c_str());
		stream = stream->next;
	}
}


void logging::PushIndent(StreamHandle handle)
{
	((StreamSet*)handle)->indent_depth++;
}


void logging::PopIndent(StreamHandle handle)
{
	((StreamSet*)handle)->indent_depth--;
}

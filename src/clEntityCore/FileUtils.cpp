
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "FileUtils.h"

#include <cstring>
#include <vector>


namespace
{
	unsigned int rotl(unsigned int x, int r)
	{
		return (x << r) | (x >> (32 - r));
	}


	unsigned int fmix(unsigned int h)
	{
		h ^= h >> 16;
		h *= 0x85ebca6b;
		h ^= h >> 13;
		h *= 0xc2b2ae35;
		h ^= h >> 16;
		return h;
	}


	//
	// Austin Appleby's MurmurHash 3: http://code.google.com/p/smhasher
	//
	unsigned int MurmurHash3(const void* key, int len, unsigned int seed)
	{
		const unsigned char* data = (const unsigned char*)key;
		int nb_blocks = len / 4;

		unsigned int h1 = seed;
		unsigned int c1 = 0xcc9e2d51;
		unsigned int c2 = 0x1b873593;

		// Body, copying each block out to stay clear of alignment issues
		for (int i = 0; i < nb_blocks; i++)
		{
			unsigned int k1;
			memcpy(&k1, data + i * 4, sizeof(k1));

			k1 *= c1;
			k1 = rotl(k1, 15);
			k1 *= c2;

			h1 ^= k1;
			h1 = rotl(h1, 13);
			h1 = h1 * 5 + 0xe6546b64;
		}

		// Tail
		const unsigned char* tail = data + nb_blocks * 4;
		unsigned int k1 = 0;
		switch (len & 3)
		{
		case (3): k1 ^= tail[2] << 16;
		case (2): k1 ^= tail[1] << 8;
		case (1): k1 ^= tail[0];
			k1 *= c1;
			k1 = rotl(k1, 15);
			k1 *= c2;
			h1 ^= k1;
		}

		// Finalisation
		h1 ^= len;
		h1 = fmix(h1);
		return h1;
	}
}


char* ReadLine(FILE* fp)
{
	// Grows to fit the longest line read so far
	static std::vector<char> line(4096);

	// Loop reading characters until EOF or EOL
	size_t pos = 0;
	while (true)
	{
		int c = fgetc(fp);
		if (c == EOF)
		{
			// Return any partial last line
			if (pos == 0)
				return 0;
			break;
		}
		if (c == '\n')
		{
			break;
		}

		// Leave room for the terminator
		if (pos + 1 >= line.size())
			line.resize(line.size() * 2);
		line[pos++] = (char)c;
	}

	// Tolerate files written with Windows line endings
	if (pos > 0 && line[pos - 1] == '\r')
		pos--;

	// Null terminate and return
	line[pos] = 0;
	return &line[0];
}


unsigned int hextoi(const char* text)
{
	// Sum each radix 16 element
	unsigned int val = 0;
	for (const char* tptr = text, *end = text + strlen(text); tptr != end; ++tptr)
	{
		val *= 16;
		int v = *tptr >= 'a' ? *tptr - 'a' + 10 : *tptr - '0';
		val += v;
	}

	return val;
}


bool startswith(const char* text, const char* cmp)
{
	return strncmp(text, cmp, strlen(cmp)) == 0;
}


bool startswith(const std::string& text, const char* cmp)
{
	return startswith(text.c_str(), cmp);
}


bool endswith(const std::string& text, const std::string& cmp)
{
	return text.size() >= cmp.size() && text.compare(text.size() - cmp.size(), cmp.size(), cmp) == 0;
}


std::string StringReplace(const std::string& str, const std::string& find, const std::string& replace)
{
	std::string res = str;
	for (size_t i = res.find(find); i != res.npos; i = res.find(find, i))
	{
		res.replace(i, find.length(), replace);
		i += replace.length();
	}
	return res;
}


std::vector<std::string> StringSplit(const std::string& str, char delimiter)
{
	std::vector<std::string> parts;
	size_t start = 0;
	while (true)
	{
		size_t end = str.find(delimiter, start);
		if (end == std::string::npos)
		{
			parts.push_back(str.substr(start));
			break;
		}
		parts.push_back(str.substr(start, end - start));
		start = end + 1;
	}
	return parts;
}


std::string UnscopeName(const std::string& name)
{
	std::string::size_type si = name.rfind("::");
	if (si == std::string::npos)
		return name;
	return name.substr(si + 2);
}


std::string ScopeName(const std::string& name)
{
	std::string::size_type si = name.rfind("::");
	if (si == std::string::npos)
		return "";
	return name.substr(0, si);
}


unsigned int HashText(const std::string& text)
{
	return MurmurHash3(text.data(), (int)text.size(), 0);
}

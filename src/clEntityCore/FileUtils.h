
//
// ===============================================================================
// clEntity, FileUtils.h - Random collection of file/string utilities.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <cstdio>
#include <string>
#include <vector>


// Returns a locally stored, null-terminated line without its '\n', or 0 at EOF. The line
// is only valid until the next call.
char* ReadLine(FILE* fp);


unsigned int hextoi(const char* text);


bool startswith(const char* text, const char* cmp);
bool startswith(const std::string& text, const char* cmp);
bool endswith(const std::string& text, const std::string& cmp);


std::string StringReplace(const std::string& str, const std::string& find, const std::string& replace);


std::vector<std::string> StringSplit(const std::string& str, char delimiter);


// "a::b::Person" -> "Person"
std::string UnscopeName(const std::string& name);

// "a::b::Person" -> "a::b", "Person" -> ""
std::string ScopeName(const std::string& name);


// MurmurHash3 of the text, used to detect changes in generated files
unsigned int HashText(const std::string& text);


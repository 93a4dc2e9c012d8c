
//
// ===============================================================================
// clEntity, CodeGen.h - Line-based C++ code generation and change-aware
// writing of generated files.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <string>
#include <vector>


//
// Simple class for generating lines of code
//
class CodeGen
{
public:
	CodeGen();

	void Line(const char* format, ...);
	void Line();

	void PrefixLine(const char* format, ...);

	void Indent();
	void UnIndent();

	void EnterScope();
	void ExitScope();

	// Closes a class or struct scope with "};"
	void ExitTypeScope();

	unsigned int GenerateHash() const;

	const std::string& GetText() const { return m_Text; }
	int Size() const { return (int)m_Text.size(); }

private:
	std::string m_Text;
	int m_Indent;
};


namespace clent
{
	struct GeneratedFile
	{
		GeneratedFile()
			: hash(0)
		{
		}

		// Relative to the output directory, with '/' separators
		std::string path;

		// Starts with the "// hash" line
		std::string text;
		unsigned int hash;
	};


	// Prefixes the hash line and moves the text into a file
	GeneratedFile FinishFile(CodeGen& cg, const std::string& path);


	//
	// Writes each file beneath the output directory, creating directories as needed. Files
	// whose first line carries the same hash are left untouched. Returns false if any
	// file couldn't be written.
	//
	bool WriteGeneratedFiles(const std::string& output_dir, const std::vector<GeneratedFile>& files);
}


//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "CodeGen.h"

#include <clEntityCore/FileUtils.h>
#include <clEntityCore/Logging.h>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

#include <cstdarg>
#include <cstdio>


namespace
{
	std::string FormatText(const char* format, va_list args)
	{
		// Measure first as generated lines can be of any length
		va_list args_copy;
		va_copy(args_copy, args);
		int length = vsnprintf(0, 0, format, args_copy);
		va_end(args_copy);
		if (length <= 0)
			return "";

		std::vector<char> buffer(length + 1);
		vsnprintf(&buffer[0], buffer.size(), format, args);
		return std::string(&buffer[0], length);
	}


	bool ReadExistingHash(const std::string& filename, unsigned int& hash)
	{
		FILE* fp = fopen(filename.c_str(), "rb");
		if (fp == 0)
			return false;
		bool read = fscanf(fp, "// %x", &hash) == 1;
		fclose(fp);
		return read;
	}


	bool WriteFile(const std::string& output_dir, const clent::GeneratedFile& file)
	{
		llvm::SmallString<256> filename(output_dir);
		llvm::sys::path::append(filename, file.path);
		std::string filename_str = filename.str().str();

		// Only touch files that have changed so that dependent builds aren't triggered
		unsigned int existing_hash = 0;
		if (ReadExistingHash(filename_str, existing_hash) && existing_hash == file.hash)
		{
			LOG(main, INFO, "Unchanged: %s\n", filename_str.c_str());
			return true;
		}

		llvm::StringRef directory = llvm::sys::path::parent_path(filename);
		if (!directory.empty())
		{
			std::error_code ec = llvm::sys::fs::create_directories(directory);
			if (ec)
			{
				LOG(main, ERROR, "Couldn't create directory '%s': %s\n", directory.str().c_str(), ec.message().c_str());
				return false;
			}
		}

		FILE* fp = fopen(filename_str.c_str(), "wb");
		if (fp == 0)
		{
			LOG(main, ERROR, "Couldn't open '%s' for writing\n", filename_str.c_str());
			return false;
		}

		// A short write or failed flush leaves a truncated file that must be reported
		bool written = fwrite(file.text.c_str(), 1, file.text.size(), fp) == file.text.size();
		if (fclose(fp) != 0)
			written = false;
		if (!written)
		{
			LOG(main, ERROR, "Couldn't write all of '%s'\n", filename_str.c_str());
			return false;
		}

		LOG(main, INFO, "Wrote: %s\n", filename_str.c_str());
		return true;
	}
}


CodeGen::CodeGen()
	: m_Indent(0)
{
}


void CodeGen::Line(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	std::string text = FormatText(format, args);
	va_end(args);

	// Don't leave trailing tabs on empty lines
	if (!text.empty())
	{
		for (int i = 0; i < m_Indent; i++)
			m_Text += "\t";
	}

	m_Text += text;
	m_Text += "\n";
}


void CodeGen::Line()
{
	// Shortcut for empty line
	Line("");
}


void CodeGen::PrefixLine(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	std::string text = FormatText(format, args);
	va_end(args);

	m_Text = text + ("\n" + m_Text);
}


void CodeGen::Indent()
{
	m_Indent++;
}


void CodeGen::UnIndent()
{
	if (m_Indent > 0)
		m_Indent--;
}


void CodeGen::EnterScope()
{
	Line("{");
	Indent();
}


void CodeGen::ExitScope()
{
	UnIndent();
	Line("}");
}


void CodeGen::ExitTypeScope()
{
	UnIndent();
	Line("};");
}


unsigned int CodeGen::GenerateHash() const
{
	return HashText(m_Text);
}


clent::GeneratedFile clent::FinishFile(CodeGen& cg, const std::string& path)
{
	// Generate the hash for the generated code so far and record it at the top
	GeneratedFile file;
	file.path = path;
	file.hash = cg.GenerateHash();
	cg.PrefixLine("// %x", file.hash);
	file.text = cg.GetText();
	return file;
}


bool clent::WriteGeneratedFiles(const std::string& output_dir, const std::vector<GeneratedFile>& files)
{
	bool all_written = true;
	for (size_t i = 0; i < files.size(); i++)
	{
		if (!WriteFile(output_dir, files[i]))
			all_written = false;
	}
	return all_written;
}

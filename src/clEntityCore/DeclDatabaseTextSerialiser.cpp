
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "DeclDatabaseTextSerialiser.h"
#include "AttributeParser.h"
#include "DeclDatabase.h"
#include "FileUtils.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>


namespace
{
	// Serialisation version
	const int CURRENT_VERSION = 2;


	// strtok merges adjacent delimiters so empty fields are written as this
	const char* EMPTY_FIELD = "-";


	const char* FieldText(const std::string& text)
	{
		return text.empty() ? EMPTY_FIELD : text.c_str();
	}


	// Free text can't be allowed to break the row or column structure
	std::string EscapeField(const std::string& text)
	{
		std::string escaped;
		for (size_t i = 0; i < text.size(); i++)
		{
			switch (text[i])
			{
			case ('\\'): escaped += "\\\\"; break;
			case ('\t'): escaped += "\\t"; break;
			case ('\n'): escaped += "\\n"; break;
			case ('\r'): escaped += "\\r"; break;
			default: escaped += text[i]; break;
			}
		}
		return escaped;
	}


	std::string UnescapeField(const char* text)
	{
		std::string unescaped;
		for (const char* c = text; *c != 0; c++)
		{
			if (*c != '\\' || c[1] == 0)
			{
				unescaped += *c;
				continue;
			}

			c++;
			switch (*c)
			{
			case ('t'): unescaped += '\t'; break;
			case ('n'): unescaped += '\n'; break;
			case ('r'): unescaped += '\r'; break;
			default: unescaped += *c; break;
			}
		}
		return unescaped;
	}


	void WriteNamedRuler(FILE* fp, const char* text)
	{
		// Overwrite the '-' character with any text to keep the ruler width consistent
		char ruler[] = "---- --------------------------------------------------------------------\n";
		strcpy(ruler + 5, text);
		ruler[5 + strlen(text)] = ' ';
		fputs(ruler, fp);
	}


	void WriteRuler(FILE* fp)
	{
		fputs("-------------------------------------------------------------------------\n", fp);
	}


	void WriteTableHeader(FILE* fp, const char* title, const char* headers)
	{
		WriteNamedRuler(fp, title);
		fputs(headers, fp);
		fputs("\n", fp);
		WriteRuler(fp);
	}


	void WriteTableFooter(FILE* fp)
	{
		WriteRuler(fp);
		fputs("\n\n", fp);
	}


	char QualifierChar(clent::TypeRef::Qualifier qualifier)
	{
		switch (qualifier)
		{
		case (clent::TypeRef::POINTER): return 'p';
		case (clent::TypeRef::REFERENCE): return 'r';
		default: return 'v';
		}
	}


	void WriteTypes(FILE* fp, const std::vector<const clent::TypeDecl*>& types)
	{
		WriteTableHeader(fp, "Types", "Name\t\tPackage\tFile\t\tLine\tFlags\tBases");
		for (size_t i = 0; i < types.size(); i++)
		{
			const clent::TypeDecl& type = *types[i];
			std::string filename = EscapeField(type.filename);
			fprintf(fp, "%s\t%s\t%s\t%d\t%x", type.name.c_str(), FieldText(type.package), FieldText(filename), type.line, type.flags);
			for (size_t j = 0; j < type.bases.size(); j++)
				fprintf(fp, "\t%s", type.bases[j].c_str());
			fputs("\n", fp);
		}
		WriteTableFooter(fp);
	}


	void WriteMembers(FILE* fp, const std::vector<const clent::TypeDecl*>& types)
	{
		WriteTableHeader(fp, "Members", "Parent\t\tName\tKind\tType\t\tQual\tCst\tShape\tRes\tParams\tMods\tLine\tArgs");
		for (size_t i = 0; i < types.size(); i++)
		{
			const clent::TypeDecl& type = *types[i];
			for (size_t j = 0; j < type.members.size(); j++)
			{
				const clent::MemberDecl& member = type.members[j];
				const clent::TypeRef& ref = member.type;
				fprintf(fp, "%s\t%s\t%c\t%s\t%c\t%d\t%s\t%d\t%d\t%x\t%d",
					type.name.c_str(),
					member.name.c_str(),
					member.kind == clent::MemberDecl::MEMBER_METHOD ? 'm' : 'f',
					FieldText(ref.name),
					QualifierChar(ref.qualifier),
					ref.is_const ? 1 : 0,
					clent::GetShapeName(ref.shape),
					ref.resolved ? 1 : 0,
					member.nb_params,
					member.modifiers,
					member.line);
				for (size_t k = 0; k < ref.args.size(); k++)
					fprintf(fp, "\t%s", FieldText(ref.args[k]));
				fputs("\n", fp);
			}
		}
		WriteTableFooter(fp);
	}


	void WriteAnnotationList(FILE* fp, const std::string& owner, const char* member, const clent::AnnotationList& annotations)
	{
		for (size_t i = 0; i < annotations.size(); i++)
		{
			const clent::AnnotationInstance& annotation = annotations[i];
			fprintf(fp, "%s\t%s\t%s\t%d\t%s\n",
				owner.c_str(),
				member,
				annotation.dialect == clent::DIALECT_JPA ? "jpa" : "attr",
				annotation.line,
				EscapeField(clent::FormatAttribute(annotation)).c_str());
		}
	}


	void WriteAnnotations(FILE* fp, const std::vector<const clent::TypeDecl*>& types)
	{
		// Members are referenced by index as accessors and overloads can share names
		WriteTableHeader(fp, "Annotations", "Owner\t\tMember\tDialect\tLine\tText");
		for (size_t i = 0; i < types.size(); i++)
		{
			const clent::TypeDecl& type = *types[i];
			WriteAnnotationList(fp, type.name, EMPTY_FIELD, type.annotations);
			for (size_t j = 0; j < type.members.size(); j++)
			{
				char index[16];
				sprintf(index, "%d", (int)j);
				WriteAnnotationList(fp, type.name, index, type.members[j].annotations);
			}
		}
		WriteTableFooter(fp);
	}
}


bool clent::WriteDeclDatabase(const char* filename, const DeclDatabase& db)
{
	FILE* fp = fopen(filename, "w");
	if (fp == 0)
		return false;

	// Write the header
	fputs("\nclEntity Declarations\n", fp);
	fprintf(fp, "Format Version: %d\n\n\n", CURRENT_VERSION);

	std::vector<const TypeDecl*> types = db.GetTypes();
	WriteTypes(fp, types);
	WriteMembers(fp, types);
	WriteAnnotations(fp, types);

	fclose(fp);
	return true;
}


namespace
{
	//
	// Simple wrapper class around strtok that remembers the delimiter and automatically
	// continues where the last token parse left off.
	//
	class StringTokeniser
	{
	public:
		StringTokeniser(char* text, const char* delimiter)
			: m_Text(text)
			, m_Delimiter(delimiter)
		{
		}

		const char* Get()
		{
			const char* token = strtok(m_Text, m_Delimiter);
			m_Text = 0;
			return token;
		}

		// Token text with the empty field placeholder mapped back to an empty string
		std::string GetField()
		{
			const char* token = Get();
			if (token == 0 || strcmp(token, EMPTY_FIELD) == 0)
				return "";
			return token;
		}

		int GetInt()
		{
			const char* token = Get();
			return token ? atoi(token) : 0;
		}

		unsigned int GetHexInt()
		{
			const char* token = Get();
			return token ? hextoi(token) : 0;
		}

		// Everything left on the line, delimiters included
		const char* GetRest()
		{
			const char* token = strtok(m_Text, "");
			m_Text = 0;
			return token;
		}

	private:
		char* m_Text;
		const char* m_Delimiter;
	};


	void ParseType(char* line, clent::DeclDatabase& db)
	{
		StringTokeniser tok(line, "\t");
		std::string name = tok.GetField();
		if (name == "")
			return;

		clent::TypeDecl& type = db.AddType(name);
		type.package = tok.GetField();
		type.filename = UnescapeField(tok.GetField().c_str());
		type.line = tok.GetInt();
		type.flags = tok.GetHexInt();
		type.bases.clear();
		while (const char* base = tok.Get())
			type.bases.push_back(base);
	}


	void ParseMember(char* line, clent::DeclDatabase& db)
	{
		StringTokeniser tok(line, "\t");
		std::string parent = tok.GetField();
		std::string name = tok.GetField();
		const char* kind = tok.Get();
		if (parent == "" || name == "" || kind == 0)
			return;

		clent::TypeRef ref;
		ref.name = tok.GetField();

		const char* qualifier = tok.Get();
		if (qualifier != 0 && *qualifier == 'p')
			ref.qualifier = clent::TypeRef::POINTER;
		else if (qualifier != 0 && *qualifier == 'r')
			ref.qualifier = clent::TypeRef::REFERENCE;

		ref.is_const = tok.GetInt() != 0;
		std::string shape = tok.GetField();
		clent::ParseShapeName(shape, ref.shape);
		ref.resolved = tok.GetInt() != 0;

		clent::TypeDecl& type = db.AddType(parent);
		clent::MemberDecl& member = db.AddMember(type, name, *kind == 'm' ? clent::MemberDecl::MEMBER_METHOD : clent::MemberDecl::MEMBER_FIELD, ref);
		member.nb_params = tok.GetInt();
		member.modifiers = tok.GetHexInt();
		member.line = tok.GetInt();
		while (const char* arg = tok.Get())
			member.type.args.push_back(strcmp(arg, EMPTY_FIELD) == 0 ? "" : arg);
	}


	void ParseAnnotation(char* line, clent::DeclDatabase& db)
	{
		StringTokeniser tok(line, "\t");
		std::string owner = tok.GetField();
		std::string member = tok.GetField();
		const char* dialect = tok.Get();
		int annotation_line = tok.GetInt();
		const char* text = tok.GetRest();
		if (owner == "" || dialect == 0 || text == 0)
			return;

		clent::TypeDecl& type = db.AddType(owner);
		clent::AnnotationList* annotations = &type.annotations;
		if (member != "")
		{
			size_t index = (size_t)atoi(member.c_str());
			if (index >= type.members.size())
				return;
			annotations = &type.members[index].annotations;
		}

		clent::Dialect d = strcmp(dialect, "jpa") == 0 ? clent::DIALECT_JPA : clent::DIALECT_NATIVE;
		std::string attribute_text = UnescapeField(text);
		clent::AnnotationList parsed = clent::ParseAttributes(d, attribute_text.c_str(), type.filename.c_str(), annotation_line);
		annotations->insert(annotations->end(), parsed.begin(), parsed.end());
	}


	template <typename PARSE_FUNC>
	void ParseTable(FILE* fp, const std::string& line, clent::DeclDatabase& db, const char* table_name, PARSE_FUNC parse_func)
	{
		// Format the table header
		char table_header[256] = "---- ";
		strcat(table_header, table_name);
		strcat(table_header, " ");

		// See if this is the required table and consume the header
		if (startswith(line, table_header))
		{
			if (ReadLine(fp) == 0)
				return;
			if (ReadLine(fp) == 0)
				return;

			// Loop reading all lines until the table completes
			while (char* subline = ReadLine(fp))
			{
				if (startswith(subline, "----"))
					break;

				parse_func(subline, db);
			}
		}
	}
}


bool clent::ReadDeclDatabase(const char* filename, DeclDatabase& db)
{
	if (!IsDeclDatabase(filename))
		return false;

	FILE* fp = fopen(filename, "r");
	if (fp == 0)
		return false;

	// Members before annotations is the only order that matters, which writing guarantees
	while (char* line = ReadLine(fp))
	{
		// Tables read on past this line
		std::string table_line = line;
		ParseTable(fp, table_line, db, "Types", ParseType);
		ParseTable(fp, table_line, db, "Members", ParseMember);
		ParseTable(fp, table_line, db, "Annotations", ParseAnnotation);
	}

	fclose(fp);
	return true;
}


bool clent::IsDeclDatabase(const char* filename)
{
	// Not a database if it doesn't exist
	FILE* fp = fopen(filename, "r");
	if (fp == 0)
		return false;

	// Parse the first few lines looking for the header
	int line_index = 0;
	bool has_header = false;
	bool is_decl_db = false;
	while (char* line = ReadLine(fp))
	{
		if (startswith(line, "clEntity Declarations"))
			has_header = true;

		// See if the version is readable
		if (has_header && startswith(line, "Format Version: "))
		{
			StringTokeniser tok(line, ":");
			tok.Get();
			const char* version = tok.Get();
			is_decl_db = version != 0 && atoi(version) == CURRENT_VERSION;
			break;
		}

		if (line_index++ > 5)
			break;
	}

	fclose(fp);
	return is_decl_db;
}


//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "Declarations.h"

#include <cstring>


namespace
{
	struct ShapeName
	{
		clent::TypeShape shape;
		const char* name;
	};

	const ShapeName g_ShapeNames[] =
	{
		{ clent::SHAPE_VALUE, "value" },
		{ clent::SHAPE_LIST, "list" },
		{ clent::SHAPE_SET, "set" },
		{ clent::SHAPE_COLLECTION, "collection" },
		{ clent::SHAPE_MAP, "map" },
		{ clent::SHAPE_OPTIONAL, "optional" },
		{ clent::SHAPE_SMART_POINTER, "pointer" },
	};
}


std::string clent::AnnotationInstance::GetText(const std::string& key, const std::string& default_value) const
{
	const AnnotationValue* value = Get(key);
	if (value == 0 || value->kind == AnnotationValue::KIND_FLAG)
		return default_value;
	return value->text;
}


int clent::AnnotationInstance::GetInt(const std::string& key, int default_value) const
{
	const AnnotationValue* value = Get(key);
	if (value == 0)
		return default_value;

	switch (value->kind)
	{
	case (AnnotationValue::KIND_INT): return value->int_value;
	case (AnnotationValue::KIND_FLOAT): return (int)value->float_value;
	default: return default_value;
	}
}


bool clent::AnnotationInstance::GetBool(const std::string& key, bool default_value) const
{
	const AnnotationValue* value = Get(key);
	if (value == 0)
		return default_value;

	switch (value->kind)
	{
	case (AnnotationValue::KIND_INT): return value->int_value != 0;
	case (AnnotationValue::KIND_SYMBOL):
		if (value->text == "true")
			return true;
		if (value->text == "false")
			return false;
		return default_value;
	default: return default_value;
	}
}


std::string clent::AnnotationInstance::GetSymbol(const std::string& key, const std::string& default_value) const
{
	const AnnotationValue* value = Get(key);
	if (value == 0 || value->kind != AnnotationValue::KIND_SYMBOL)
		return default_value;
	return value->text;
}


const char* clent::GetShapeName(TypeShape shape)
{
	for (size_t i = 0; i < sizeof(g_ShapeNames) / sizeof(g_ShapeNames[0]); i++)
	{
		if (g_ShapeNames[i].shape == shape)
			return g_ShapeNames[i].name;
	}
	return "value";
}


bool clent::ParseShapeName(const std::string& name, TypeShape& shape)
{
	for (size_t i = 0; i < sizeof(g_ShapeNames) / sizeof(g_ShapeNames[0]); i++)
	{
		if (name == g_ShapeNames[i].name)
		{
			shape = g_ShapeNames[i].shape;
			return true;
		}
	}
	return false;
}


std::string clent::StripTypeQualifiers(const std::string& type_name)
{
	std::string name = type_name;

	// Leading cv-qualifiers and elaborated type specifiers
	const char* prefixes[] = { "const ", "volatile ", "struct ", "class " };
	for (bool stripped = true; stripped; )
	{
		stripped = false;
		for (size_t i = 0; i < sizeof(prefixes) / sizeof(prefixes[0]); i++)
		{
			if (name.compare(0, strlen(prefixes[i]), prefixes[i]) == 0)
			{
				name = name.substr(strlen(prefixes[i]));
				stripped = true;
			}
		}
	}

	// Trailing declarators and cv-qualifiers
	for (bool stripped = true; stripped && !name.empty(); )
	{
		stripped = false;
		char c = name[name.size() - 1];
		if (c == '*' || c == '&' || c == ' ')
		{
			name.erase(name.size() - 1);
			stripped = true;
		}
		else if (name.size() > 6 && name.compare(name.size() - 6, 6, " const") == 0)
		{
			name.erase(name.size() - 6);
			stripped = true;
		}
	}

	return name;
}


std::string clent::TypeRef::GetElement() const
{
	return HasElement() ? StripTypeQualifiers(args[0]) : std::string();
}


std::string clent::TypeRef::GetFullName() const
{
	if (args.empty())
		return name;

	std::string full_name = name + "<";
	for (size_t i = 0; i < args.size(); i++)
	{
		if (i)
			full_name += ", ";
		full_name += args[i];
	}
	full_name += ">";
	return full_name;
}


//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "Descriptors.h"


const char* clent::GetEntityKindName(EntityKind kind)
{
	switch (kind)
	{
	case (KIND_ENTITY): return "entity";
	case (KIND_SUPERCLASS): return "superclass";
	case (KIND_EMBEDDABLE): return "embeddable";
	}
	return "unknown";
}


const char* clent::GetCardinalityName(Cardinality cardinality)
{
	switch (cardinality)
	{
	case (CARDINALITY_NONE): return "none";
	case (ONE_TO_ONE): return "one_to_one";
	case (ONE_TO_MANY): return "one_to_many";
	case (MANY_TO_ONE): return "many_to_one";
	case (MANY_TO_MANY): return "many_to_many";
	}
	return "unknown";
}


const char* clent::GetPropertyNameStyleName(PropertyNameStyle style)
{
	switch (style)
	{
	case (STYLE_BEAN): return "BEAN";
	case (STYLE_FLUENT_BEAN): return "FLUENT_BEAN";
	case (STYLE_FLUENT): return "FLUENT";
	case (STYLE_NONE): return "NONE";
	}
	return "BEAN";
}


bool clent::ParsePropertyNameStyle(const std::string& name, PropertyNameStyle& style)
{
	if (name == "BEAN")
		style = STYLE_BEAN;
	else if (name == "FLUENT_BEAN")
		style = STYLE_FLUENT_BEAN;
	else if (name == "FLUENT")
		style = STYLE_FLUENT;
	else if (name == "NONE")
		style = STYLE_NONE;
	else
		return false;
	return true;
}


bool clent::ParsePropertyVisibility(const std::string& name, PropertyVisibility& visibility)
{
	if (name == "PUBLIC")
		visibility = VISIBILITY_PUBLIC;
	else if (name == "PROTECTED")
		visibility = VISIBILITY_PROTECTED;
	else if (name == "PRIVATE")
		visibility = VISIBILITY_PRIVATE;
	else
		return false;
	return true;
}

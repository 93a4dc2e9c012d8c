
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "ProcessingContext.h"


clent::ProcessingContext::ProcessingContext(const DeclarationAdapter& adapter, const ProcessingOptions& options)
	: m_Adapter(adapter)
	, m_Options(options)
	, m_Catalog(options.generate_jpa)
{
}


const clent::EntityMap& clent::ProcessingContext::GetDescriptors(EntityKind kind) const
{
	switch (kind)
	{
	case (KIND_SUPERCLASS): return m_Superclasses;
	case (KIND_EMBEDDABLE): return m_Embeddables;
	default: return m_Entities;
	}
}


clent::EntityMap& clent::ProcessingContext::GetMap(EntityKind kind)
{
	switch (kind)
	{
	case (KIND_SUPERCLASS): return m_Superclasses;
	case (KIND_EMBEDDABLE): return m_Embeddables;
	default: return m_Entities;
	}
}


const clent::EntityDescriptor* clent::ProcessingContext::FindDescriptor(EntityKind kind, const std::string& qualified_name) const
{
	const EntityMap& map = GetDescriptors(kind);
	EntityMap::const_iterator i = map.find(qualified_name);
	if (i == map.end())
		return 0;
	return &i->second;
}


bool clent::ProcessingContext::AddDescriptor(const EntityDescriptor& descriptor)
{
	EntityMap& map = GetMap(descriptor.kind);
	if (map.find(descriptor.qualified_name) != map.end())
		return false;
	map[descriptor.qualified_name] = descriptor;
	return true;
}


void clent::ProcessingContext::MarkInvalid(const std::string& qualified_name)
{
	m_Invalid.insert(qualified_name);
}


bool clent::ProcessingContext::IsInvalid(const std::string& qualified_name) const
{
	return m_Invalid.find(qualified_name) != m_Invalid.end();
}


//
// ===============================================================================
// clEntity, ContainerSpecs.h - First pass traversal of the clang AST for C++,
// locating container shape specifications.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#pragma once


#include <clEntityCore/Declarations.h>

#include <map>
#include <string>


namespace clang
{
	class TranslationUnitDecl;
}


//
// Maps qualified template names to the shape of container they implement. Starts with the
// standard library containers and is extended by clent_container declarations.
//
class ContainerSpecs
{
public:
	ContainerSpecs(const std::string& spec_log);

	void Gather(clang::TranslationUnitDecl* tu_decl);

	bool GetShape(const std::string& template_name, clent::TypeShape& shape) const;

	void AddContainerSpec(const std::string& template_name, clent::TypeShape shape);

private:
	typedef std::map<std::string, clent::TypeShape> ShapeMap;
	ShapeMap m_Shapes;
};

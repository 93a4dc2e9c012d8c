
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "ContainerSpecs.h"

#include <clEntityCore/Logging.h>

#include <clang/AST/Attr.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>

#include <llvm/ADT/SmallVector.h>


namespace
{
	struct StandardContainer
	{
		const char* name;
		clent::TypeShape shape;
	};

	const StandardContainer g_StandardContainers[] =
	{
		{ "std::vector", clent::SHAPE_LIST },
		{ "std::list", clent::SHAPE_LIST },
		{ "std::deque", clent::SHAPE_LIST },
		{ "std::set", clent::SHAPE_SET },
		{ "std::unordered_set", clent::SHAPE_SET },
		{ "std::multiset", clent::SHAPE_SET },
		{ "std::map", clent::SHAPE_MAP },
		{ "std::unordered_map", clent::SHAPE_MAP },
		{ "std::multimap", clent::SHAPE_MAP },
		{ "std::optional", clent::SHAPE_OPTIONAL },
		{ "std::shared_ptr", clent::SHAPE_SMART_POINTER },
		{ "std::unique_ptr", clent::SHAPE_SMART_POINTER },
	};


	void GatherNamespace(ContainerSpecs& specs, clang::NamespaceDecl* ns_decl)
	{
		for (clang::DeclContext::decl_iterator i = ns_decl->decls_begin(); i != ns_decl->decls_end(); ++i)
		{
			clang::CXXRecordDecl* record_decl = llvm::dyn_cast<clang::CXXRecordDecl>(*i);
			if (record_decl == 0)
			{
				LOG(spec, WARNING, "Ill-formed Container Spec; only structures are expected\n");
				continue;
			}

			clang::specific_attr_iterator<clang::AnnotateAttr> j = record_decl->specific_attr_begin<clang::AnnotateAttr>();
			if (j == record_decl->specific_attr_end<clang::AnnotateAttr>())
			{
				LOG(spec, WARNING, "Ill-formed Container Spec; no annotation attribute found on the structure\n");
				continue;
			}

			// Split the fields of the annotation
			llvm::StringRef annotation = (*j)->getAnnotation();
			llvm::SmallVector<llvm::StringRef, 3> info;
			annotation.split(info, "-");
			if (info.size() != 3 || info[0] != "container")
			{
				LOG(spec, WARNING, "Ill-formed Container Spec; expecting 'container-<name>-<shape>'\n");
				continue;
			}

			clent::TypeShape shape;
			if (!clent::ParseShapeName(info[2].str(), shape))
			{
				LOG(spec, WARNING, "Ill-formed Container Spec; unknown shape '%s'\n", info[2].str().c_str());
				continue;
			}

			specs.AddContainerSpec(info[1].str(), shape);
		}
	}
}


ContainerSpecs::ContainerSpecs(const std::string& spec_log)
{
	LOG_TO_STDOUT(spec, WARNING);
	LOG_TO_STDOUT(spec, ERROR);

	if (spec_log != "")
		LOG_TO_FILE(spec, ALL, spec_log.c_str());

	for (size_t i = 0; i < sizeof(g_StandardContainers) / sizeof(g_StandardContainers[0]); i++)
		m_Shapes[g_StandardContainers[i].name] = g_StandardContainers[i].shape;
}


void ContainerSpecs::Gather(clang::TranslationUnitDecl* tu_decl)
{
	// Container registrations are only looked for at global scope
	for (clang::DeclContext::decl_iterator i = tu_decl->decls_begin(); i != tu_decl->decls_end(); ++i)
	{
		clang::NamespaceDecl* ns_decl = llvm::dyn_cast<clang::NamespaceDecl>(*i);
		if (ns_decl != 0 && ns_decl->getName() == "clent_internal")
			GatherNamespace(*this, ns_decl);
	}
}


bool ContainerSpecs::GetShape(const std::string& template_name, clent::TypeShape& shape) const
{
	ShapeMap::const_iterator i = m_Shapes.find(template_name);
	if (i == m_Shapes.end())
		return false;
	shape = i->second;
	return true;
}


void ContainerSpecs::AddContainerSpec(const std::string& template_name, clent::TypeShape shape)
{
	// Leading global scope operators are allowed in the macro
	std::string name = template_name;
	if (name.compare(0, 2, "::") == 0)
		name = name.substr(2);

	m_Shapes[name] = shape;
	LOG(spec, INFO, "Container Spec: %s / %s\n", name.c_str(), clent::GetShapeName(shape));
}

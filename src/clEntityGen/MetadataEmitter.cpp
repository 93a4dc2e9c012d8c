
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "MetadataEmitter.h"

#include <clEntityCore/EntityGraph.h>
#include <clEntityCore/FileUtils.h>
#include <clEntityCore/Logging.h>
#include <clEntityCore/ProcessingContext.h>
#include <clEntityCore/Validator.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>


namespace
{
	//
	// How generated code reads the value of a property
	//
	enum ValueAccess
	{
		// Field of the user type
		ACCESS_FIELD,

		// Implemented accessor of the user type, read-only to generated code
		ACCESS_METHOD,

		// Pure virtual accessor, implemented by generated code over its own storage
		ACCESS_STORAGE,
	};


	ValueAccess GetValueAccess(const clent::PropertyDescriptor& property)
	{
		if (property.member_kind == clent::MemberDecl::MEMBER_FIELD)
			return ACCESS_FIELD;
		if (property.member != 0 && (property.member->modifiers & clent::MOD_PURE))
			return ACCESS_STORAGE;
		return ACCESS_METHOD;
	}


	std::string Capitalise(const std::string& name)
	{
		std::string text = name;
		if (!text.empty())
			text[0] = (char)toupper((unsigned char)text[0]);
		return text;
	}


	// Escapes text for use in a string literal
	std::string Quote(const std::string& text)
	{
		std::string quoted = "\"";
		for (size_t i = 0; i < text.size(); i++)
		{
			if (text[i] == '\"' || text[i] == '\\')
				quoted += '\\';
			quoted += text[i];
		}
		return quoted + "\"";
	}


	std::string PackagePath(const std::string& package)
	{
		if (package == "")
			return "";
		return StringReplace(package, "::", "/") + "/";
	}


	std::string Qualify(const std::string& package, const std::string& name)
	{
		if (package == "")
			return name;
		return package + "::" + name;
	}


	std::string MetaName(const clent::EntityDescriptor& entity)
	{
		return clent::GetLocalName(entity) + "_";
	}


	std::string MetaHeaderPath(const clent::EntityDescriptor& entity)
	{
		return PackagePath(entity.package_name) + MetaName(entity) + ".h";
	}


	std::string ImplementationHeaderPath(const clent::EntityDescriptor& entity)
	{
		return PackagePath(entity.package_name) + clent::GetImplementationName(entity) + ".h";
	}


	bool HasImplementation(const clent::EntityDescriptor& entity)
	{
		return entity.kind == clent::KIND_ENTITY && !entity.is_immutable;
	}


	// Storage type for a property value, dropping references and top-level const
	std::string StorageType(const clent::TypeRef& type)
	{
		if (type.qualifier == clent::TypeRef::POINTER)
			return (type.is_const ? "const " : "") + type.GetFullName() + "*";
		return type.GetFullName();
	}


	// The type exactly as declared
	std::string DeclaredType(const clent::TypeRef& type)
	{
		std::string text = (type.is_const ? "const " : "") + type.GetFullName();
		if (type.qualifier == clent::TypeRef::POINTER)
			text += "*";
		else if (type.qualifier == clent::TypeRef::REFERENCE)
			text += "&";
		return text;
	}


	std::string ParameterType(const clent::TypeRef& type)
	{
		if (type.qualifier == clent::TypeRef::POINTER)
			return StorageType(type);
		return "const " + type.GetFullName() + "&";
	}


	std::string StateField(const clent::PropertyDescriptor& property)
	{
		return "m_" + Capitalise(property.name) + "State";
	}


	std::string StateAccessor(const clent::PropertyDescriptor& property)
	{
		return "Get" + Capitalise(property.name) + "State";
	}


	std::string StorageField(const clent::PropertyDescriptor& property)
	{
		return "m_" + Capitalise(property.name);
	}


	// Expression reading the property value, prefixed with an object expression if given
	std::string ValueExpression(const clent::PropertyDescriptor& property, const char* object)
	{
		std::string prefix = object ? std::string(object) + "." : std::string();
		switch (GetValueAccess(property))
		{
		case (ACCESS_FIELD): return prefix + property.declaring_type + "::" + property.member_name;
		case (ACCESS_METHOD): return prefix + property.declaring_type + "::" + property.member_name + "()";
		default: return prefix + StorageField(property);
		}
	}


	const char* GetVisibilityLabel(clent::PropertyVisibility visibility)
	{
		switch (visibility)
		{
		case (clent::VISIBILITY_PROTECTED): return "protected:";
		case (clent::VISIBILITY_PRIVATE): return "private:";
		default: return "public:";
		}
	}


	const char* GetBuilderName(clent::TypeShape shape)
	{
		switch (shape)
		{
		case (clent::SHAPE_LIST): return "clent::BuildList";
		case (clent::SHAPE_SET): return "clent::BuildSet";
		case (clent::SHAPE_COLLECTION): return "clent::BuildCollection";
		case (clent::SHAPE_MAP): return "clent::BuildMap";
		default: return "clent::Build";
		}
	}


	const char* GetCardinalityConstant(clent::Cardinality cardinality)
	{
		switch (cardinality)
		{
		case (clent::ONE_TO_ONE): return "clent::ONE_TO_ONE";
		case (clent::ONE_TO_MANY): return "clent::ONE_TO_MANY";
		case (clent::MANY_TO_ONE): return "clent::MANY_TO_ONE";
		case (clent::MANY_TO_MANY): return "clent::MANY_TO_MANY";
		default: return "clent::CARDINALITY_NONE";
		}
	}


	const char* BoolText(bool value)
	{
		return value ? "true" : "false";
	}


	std::vector<const clent::PropertyDescriptor*> GetPersistentProperties(const clent::EntityDescriptor& entity)
	{
		std::vector<const clent::PropertyDescriptor*> properties;
		for (size_t i = 0; i < entity.properties.size(); i++)
		{
			if (!entity.properties[i].is_transient)
				properties.push_back(&entity.properties[i]);
		}
		return properties;
	}


	// Relationships and wrappers compare by address or have no std::hash in C++14
	bool IsComparableByValue(const clent::PropertyDescriptor& property)
	{
		if (property.cardinality != clent::CARDINALITY_NONE)
			return false;
		return property.type.shape != clent::SHAPE_OPTIONAL && property.type.shape != clent::SHAPE_SMART_POINTER;
	}


	// Key properties if there are any, otherwise every persistent property that compares by value
	std::vector<const clent::PropertyDescriptor*> GetIdentityProperties(const clent::EntityDescriptor& entity)
	{
		std::vector<const clent::PropertyDescriptor*> properties = GetPersistentProperties(entity);
		std::vector<const clent::PropertyDescriptor*> keys;
		std::vector<const clent::PropertyDescriptor*> values;
		for (size_t i = 0; i < properties.size(); i++)
		{
			if (properties[i]->is_key)
				keys.push_back(properties[i]);
			if (IsComparableByValue(*properties[i]))
				values.push_back(properties[i]);
		}
		return keys.empty() ? values : keys;
	}


	// One scope per level as nested namespace definitions need C++17
	void EnterNamespace(CodeGen& cg, const std::string& package)
	{
		if (package == "")
			return;
		std::vector<std::string> names = StringSplit(StringReplace(package, "::", ":"), ':');
		for (size_t i = 0; i < names.size(); i++)
		{
			cg.Line("namespace %s", names[i].c_str());
			cg.EnterScope();
		}
	}


	void ExitNamespace(CodeGen& cg, const std::string& package)
	{
		if (package == "")
			return;
		std::vector<std::string> names = StringSplit(StringReplace(package, "::", ":"), ':');
		for (size_t i = 0; i < names.size(); i++)
			cg.ExitScope();
	}


	void GenerateAccessors(CodeGen& cg, const clent::EntityDescriptor& entity, const clent::PropertyDescriptor& property)
	{
		ValueAccess access = GetValueAccess(property);

		// Accessors the user type implements are left alone
		if (access == ACCESS_METHOD)
			return;

		std::string value = ValueExpression(property, 0);
		std::string getter = clent::GetGetterName(entity, property);
		if (access == ACCESS_STORAGE)
		{
			bool is_const = property.member != 0 && (property.member->modifiers & clent::MOD_CONST) != 0;
			cg.Line("%s %s()%s override { return %s; }", DeclaredType(property.type).c_str(), getter.c_str(), is_const ? " const" : "", value.c_str());
		}
		else
		{
			std::string return_type = property.type.qualifier == clent::TypeRef::POINTER ? StorageType(property.type) : ParameterType(property.type);
			cg.Line("%s %s() const { return %s; }", return_type.c_str(), getter.c_str(), value.c_str());
		}

		std::string setter = clent::GetSetterName(entity, property);
		if (setter == "")
			return;
		if (property.is_transient)
			cg.Line("void %s(%s value) { %s = value; }", setter.c_str(), ParameterType(property.type).c_str(), value.c_str());
		else
			cg.Line("void %s(%s value) { %s = value; %s = clent::STATE_MODIFIED; }", setter.c_str(), ParameterType(property.type).c_str(), value.c_str(), StateField(property).c_str());
	}


	void GenerateEquality(CodeGen& cg, const std::string& class_name, const std::vector<const clent::PropertyDescriptor*>& identity)
	{
		cg.Line("bool operator == (const %s& other) const", class_name.c_str());
		cg.EnterScope();
		if (identity.empty())
		{
			cg.Line("return true;");
		}
		else
		{
			for (size_t i = 0; i < identity.size(); i++)
			{
				const char* prefix = i == 0 ? "return " : "\t&& ";
				const char* suffix = i == identity.size() - 1 ? ";" : "";
				cg.Line("%s%s == %s%s", prefix, ValueExpression(*identity[i], 0).c_str(), ValueExpression(*identity[i], "other").c_str(), suffix);
			}
		}
		cg.ExitScope();
		cg.Line();

		cg.Line("bool operator != (const %s& other) const", class_name.c_str());
		cg.EnterScope();
		cg.Line("return !(*this == other);");
		cg.ExitScope();
		cg.Line();

		cg.Line("size_t Hash() const override");
		cg.EnterScope();
		cg.Line("size_t seed = 0;");
		for (size_t i = 0; i < identity.size(); i++)
			cg.Line("clent::HashValue(seed, %s);", ValueExpression(*identity[i], 0).c_str());
		cg.Line("return seed;");
		cg.ExitScope();
	}


	clent::GeneratedFile GenerateImplementation(const clent::EntityDescriptor& entity)
	{
		std::string class_name = clent::GetImplementationName(entity);
		std::vector<const clent::PropertyDescriptor*> persistent = GetPersistentProperties(entity);

		CodeGen cg;
		cg.Line("#pragma once");
		cg.Line();
		cg.Line("#include \"%s\"", entity.source_file.c_str());
		cg.Line("#include \"%s\"", MetaHeaderPath(entity).c_str());
		cg.Line();
		cg.Line("#include <clent/Meta.h>");
		cg.Line();
		cg.Line("#include <string>");
		cg.Line();
		cg.Line();
		EnterNamespace(cg, entity.package_name);

		cg.Line("//");
		cg.Line("// Implementation of %s", entity.qualified_name.c_str());
		cg.Line("//");
		cg.Line("class %s : public %s, public clent::Persistable", class_name.c_str(), entity.qualified_name.c_str());
		cg.Line("{");
		cg.Line("public:");
		cg.Indent();

		// Constructor initialising state and storage
		std::vector<std::string> initialisers;
		for (size_t i = 0; i < entity.properties.size(); i++)
		{
			const clent::PropertyDescriptor& property = entity.properties[i];
			if (!property.is_transient)
				initialisers.push_back(StateField(property) + "(clent::STATE_FETCH)");
			if (GetValueAccess(property) == ACCESS_STORAGE)
				initialisers.push_back(StorageField(property) + "()");
		}
		cg.Line("%s()", class_name.c_str());
		cg.Indent();
		for (size_t i = 0; i < initialisers.size(); i++)
			cg.Line("%s %s", i == 0 ? ":" : ",", initialisers[i].c_str());
		cg.UnIndent();
		cg.Line("{");
		cg.Line("}");
		cg.Line();

		// Property accessors
		cg.UnIndent();
		cg.Line("%s", GetVisibilityLabel(entity.property_visibility));
		cg.Indent();
		for (size_t i = 0; i < entity.properties.size(); i++)
			GenerateAccessors(cg, entity, entity.properties[i]);
		cg.Line();

		cg.UnIndent();
		cg.Line("public:");
		cg.Indent();
		for (size_t i = 0; i < persistent.size(); i++)
			cg.Line("clent::PropertyState %s() const { return %s; }", StateAccessor(*persistent[i]).c_str(), StateField(*persistent[i]).c_str());
		cg.Line();

		GenerateEquality(cg, class_name, GetIdentityProperties(entity));
		cg.Line();

		cg.Line("const clent::TypeDescriptor& GetType() const override");
		cg.EnterScope();
		cg.Line("return %s::Instance().TYPE;", MetaName(entity).c_str());
		cg.ExitScope();
		cg.Line();

		cg.Line("clent::PropertyStates GetPropertyStates() const override");
		cg.EnterScope();
		cg.Line("clent::PropertyStates states;");
		for (size_t i = 0; i < persistent.size(); i++)
			cg.Line("states.push_back(std::make_pair(std::string(%s), %s));", Quote(persistent[i]->name).c_str(), StateField(*persistent[i]).c_str());
		cg.Line("return states;");
		cg.ExitScope();
		cg.Line();

		cg.Line("std::string ToString() const override");
		cg.EnterScope();
		cg.Line("std::string text = %s;", Quote(entity.simple_name + " [").c_str());
		for (size_t i = 0; i < persistent.size(); i++)
		{
			std::string label = (i ? ", " : "") + persistent[i]->name + "=";
			cg.Line("text += %s + clent::ToText(%s);", Quote(label).c_str(), ValueExpression(*persistent[i], 0).c_str());
		}
		cg.Line("return text + \"]\";");
		cg.ExitScope();

		cg.UnIndent();
		cg.Line();
		cg.Line("private:");
		cg.Indent();
		for (size_t i = 0; i < entity.properties.size(); i++)
		{
			const clent::PropertyDescriptor& property = entity.properties[i];
			if (!property.is_transient)
				cg.Line("clent::PropertyState %s;", StateField(property).c_str());
			if (GetValueAccess(property) == ACCESS_STORAGE)
				cg.Line("%s %s;", StorageType(property.type).c_str(), StorageField(property).c_str());
		}
		cg.ExitTypeScope();

		ExitNamespace(cg, entity.package_name);
		return clent::FinishFile(cg, ImplementationHeaderPath(entity));
	}


	clent::GeneratedFile GenerateMetaHeader(const clent::EntityDescriptor& entity)
	{
		std::string class_name = MetaName(entity);
		std::vector<const clent::PropertyDescriptor*> persistent = GetPersistentProperties(entity);

		CodeGen cg;
		cg.Line("#pragma once");
		cg.Line();
		cg.Line("#include <clent/Meta.h>");
		cg.Line();
		cg.Line();
		EnterNamespace(cg, entity.package_name);

		cg.Line("//");
		cg.Line("// Metadata for %s %s", clent::GetEntityKindName(entity.kind), entity.qualified_name.c_str());
		cg.Line("//");
		cg.Line("class %s", class_name.c_str());
		cg.Line("{");
		cg.Line("public:");
		cg.Indent();
		cg.Line("static const %s& Instance();", class_name.c_str());
		cg.Line();
		cg.Line("// Can be referenced before Instance() is first called");
		cg.Line("static const clent::TypeDescriptor& Type();");
		cg.Line();
		cg.Line("const clent::TypeDescriptor& TYPE;");
		if (!persistent.empty())
			cg.Line();
		for (size_t i = 0; i < persistent.size(); i++)
			cg.Line("const clent::AttributeDescriptor& %s;", clent::GetAttributeName(persistent[i]->name).c_str());
		cg.UnIndent();
		cg.Line();
		cg.Line("private:");
		cg.Indent();
		cg.Line("%s();", class_name.c_str());
		cg.Line("%s(const %s&) = delete;", class_name.c_str(), class_name.c_str());
		cg.Line("%s& operator = (const %s&) = delete;", class_name.c_str(), class_name.c_str());
		if (!persistent.empty())
		{
			cg.Line();
			cg.Line("clent::AttributeDescriptor m_Attributes[%d];", (int)persistent.size());
		}
		cg.ExitTypeScope();

		ExitNamespace(cg, entity.package_name);
		return clent::FinishFile(cg, MetaHeaderPath(entity));
	}


	void GenerateAttribute(CodeGen& cg, const clent::EntityGraph& graph, const clent::EntityDescriptor& entity,
		const clent::PropertyDescriptor& property, int index)
	{
		std::vector<std::string> calls;
		calls.push_back(".SetGetter(" + Quote(clent::GetGetterName(entity, property)) + ")");
		std::string setter = clent::GetSetterName(entity, property);
		if (setter != "")
			calls.push_back(".SetSetter(" + Quote(setter) + ")");

		if (property.is_key)
			calls.push_back(".SetKey(true)");
		if (property.is_version)
			calls.push_back(".SetVersion(true)");
		if (property.is_nullable)
			calls.push_back(".SetNullable(true)");
		if (property.is_generated)
			calls.push_back(".SetGenerated(true)");
		if (property.is_read_only)
			calls.push_back(".SetReadOnly(true)");
		if (property.is_lazy)
			calls.push_back(".SetLazy(true)");

		if (property.cardinality != clent::CARDINALITY_NONE)
		{
			calls.push_back(std::string(".SetCardinality(") + GetCardinalityConstant(property.cardinality) + ")");
			const clent::RelationshipEdge* edge = graph.FindEdge(entity.qualified_name, property.name);
			const clent::EntityDescriptor* target = edge ? graph.Find(edge->target) : 0;
			if (target != 0)
				calls.push_back(".SetReferencedType(&" + Qualify(target->package_name, MetaName(*target)) + "::Type())");
		}

		if (HasImplementation(entity))
		{
			std::string implementation = Qualify(entity.package_name, clent::GetImplementationName(entity));
			calls.push_back(".SetPropertyState([](const void* entity) { return static_cast<const " + implementation + "*>(entity)->" + StateAccessor(property) + "(); })");
		}

		cg.Line("%s(m_Attributes[%d], %s, %s)", GetBuilderName(property.type.shape), index, Quote(property.name).c_str(), Quote(property.column_name).c_str());
		cg.Indent();
		for (size_t i = 0; i < calls.size(); i++)
			cg.Line("%s%s", calls[i].c_str(), i == calls.size() - 1 ? ";" : "");
		cg.UnIndent();
		cg.Line("type.AddAttribute(m_Attributes[%d]);", index);
	}


	clent::GeneratedFile GenerateMetaSource(const clent::EntityGraph& graph, const clent::EntityDescriptor& entity)
	{
		std::string class_name = MetaName(entity);
		std::string qualified_class_name = Qualify(entity.package_name, class_name);
		std::vector<const clent::PropertyDescriptor*> persistent = GetPersistentProperties(entity);

		// Gather the metadata of every referenced type
		std::set<std::string> includes;
		for (size_t i = 0; i < persistent.size(); i++)
		{
			const clent::RelationshipEdge* edge = graph.FindEdge(entity.qualified_name, persistent[i]->name);
			const clent::EntityDescriptor* target = edge ? graph.Find(edge->target) : 0;
			if (target != 0 && target != &entity)
				includes.insert(MetaHeaderPath(*target));
		}

		CodeGen cg;
		cg.Line("#include \"%s\"", MetaHeaderPath(entity).c_str());
		for (std::set<std::string>::const_iterator i = includes.begin(); i != includes.end(); ++i)
			cg.Line("#include \"%s\"", i->c_str());
		if (HasImplementation(entity))
			cg.Line("#include \"%s\"", ImplementationHeaderPath(entity).c_str());
		cg.Line("#include \"%s\"", entity.source_file.c_str());
		cg.Line();
		cg.Line("#include <typeinfo>");
		cg.Line();
		cg.Line();

		cg.Line("namespace");
		cg.EnterScope();
		cg.Line("clent::TypeDescriptor& TypeStorage()");
		cg.EnterScope();
		cg.Line("static clent::TypeDescriptor type;");
		cg.Line("return type;");
		cg.ExitScope();
		cg.ExitScope();
		cg.Line();
		cg.Line();

		cg.Line("const %s& %s::Instance()", qualified_class_name.c_str(), qualified_class_name.c_str());
		cg.EnterScope();
		cg.Line("static %s instance;", class_name.c_str());
		cg.Line("return instance;");
		cg.ExitScope();
		cg.Line();
		cg.Line();

		cg.Line("const clent::TypeDescriptor& %s::Type()", qualified_class_name.c_str());
		cg.EnterScope();
		cg.Line("return TypeStorage();");
		cg.ExitScope();
		cg.Line();
		cg.Line();

		cg.Line("%s::%s()", qualified_class_name.c_str(), class_name.c_str());
		cg.Indent();
		cg.Line(": TYPE(TypeStorage())");
		for (size_t i = 0; i < persistent.size(); i++)
			cg.Line(", %s(m_Attributes[%d])", clent::GetAttributeName(persistent[i]->name).c_str(), (int)i);
		cg.UnIndent();
		cg.EnterScope();

		cg.Line("clent::TypeBuilder type(TypeStorage(), %s, %s, typeid(%s));",
			Quote(entity.table_name).c_str(), Quote(entity.qualified_name).c_str(), entity.qualified_name.c_str());
		cg.Line("type.SetReadOnly(%s)", BoolText(entity.is_read_only));
		cg.Indent();
		cg.Line(".SetStateless(%s)", BoolText(entity.is_stateless));
		cg.Line(".SetImmutable(%s)", BoolText(entity.is_immutable));
		cg.Line(".SetCacheable(%s)", BoolText(entity.is_cacheable));
		cg.Line(".SetView(%s);", BoolText(entity.is_view));
		cg.UnIndent();

		for (size_t i = 0; i < persistent.size(); i++)
		{
			cg.Line();
			GenerateAttribute(cg, graph, entity, *persistent[i], (int)i);
		}

		cg.ExitScope();
		return clent::FinishFile(cg, PackagePath(entity.package_name) + class_name + ".cpp");
	}


	void GenerateModels(const std::string& package, const std::vector<const clent::EntityDescriptor*>& entities, std::vector<clent::GeneratedFile>& files)
	{
		CodeGen h;
		h.Line("#pragma once");
		h.Line();
		h.Line("#include <clent/Meta.h>");
		h.Line();
		h.Line("#include <vector>");
		h.Line();
		h.Line();
		EnterNamespace(h, package);
		h.Line("// Type descriptors of every entity in the package");
		h.Line("const std::vector<const clent::TypeDescriptor*>& Models();");
		ExitNamespace(h, package);
		files.push_back(clent::FinishFile(h, PackagePath(package) + "Models.h"));

		CodeGen cpp;
		cpp.Line("#include \"%s\"", (PackagePath(package) + "Models.h").c_str());
		for (size_t i = 0; i < entities.size(); i++)
			cpp.Line("#include \"%s\"", MetaHeaderPath(*entities[i]).c_str());
		cpp.Line();
		cpp.Line();
		cpp.Line("namespace");
		cpp.EnterScope();
		cpp.Line("std::vector<const clent::TypeDescriptor*> BuildModels()");
		cpp.EnterScope();
		cpp.Line("std::vector<const clent::TypeDescriptor*> models;");
		for (size_t i = 0; i < entities.size(); i++)
			cpp.Line("models.push_back(&%s::Instance().TYPE);", Qualify(entities[i]->package_name, MetaName(*entities[i])).c_str());
		cpp.Line("return models;");
		cpp.ExitScope();
		cpp.ExitScope();
		cpp.Line();
		cpp.Line();
		cpp.Line("const std::vector<const clent::TypeDescriptor*>& %s()", Qualify(package, "Models").c_str());
		cpp.EnterScope();
		cpp.Line("static const std::vector<const clent::TypeDescriptor*> models = BuildModels();");
		cpp.Line("return models;");
		cpp.ExitScope();
		files.push_back(clent::FinishFile(cpp, PackagePath(package) + "Models.cpp"));
	}


	bool ComparePaths(const clent::GeneratedFile& a, const clent::GeneratedFile& b)
	{
		return a.path < b.path;
	}
}


std::string clent::GetAttributeName(const std::string& property_name)
{
	std::string name;
	for (size_t i = 0; i < property_name.size(); i++)
	{
		char c = property_name[i];
		if (i > 0 && isupper((unsigned char)c) && !isupper((unsigned char)property_name[i - 1]))
			name += '_';
		name += (char)toupper((unsigned char)c);
	}

	// Keep clear of the type descriptor member
	if (name == "TYPE")
		name += "_";
	return name;
}


std::string clent::GetGetterName(const EntityDescriptor& entity, const PropertyDescriptor& property)
{
	if (property.member_kind == MemberDecl::MEMBER_METHOD)
		return property.member_name;

	switch (entity.property_name_style)
	{
	case (STYLE_BEAN):
	case (STYLE_FLUENT_BEAN):
		return (property.IsBoolean() ? "is" : "get") + Capitalise(property.name);
	default:
		return property.name;
	}
}


std::string clent::GetSetterName(const EntityDescriptor& entity, const PropertyDescriptor& property)
{
	if (property.is_read_only || GetValueAccess(property) == ACCESS_METHOD)
		return "";

	switch (entity.property_name_style)
	{
	case (STYLE_BEAN): return "set" + Capitalise(property.name);
	default: return property.name;
	}
}


std::string clent::GetImplementationName(const EntityDescriptor& entity)
{
	if (entity.entity_name != "" && IsValidIdentifier(entity.entity_name))
		return entity.entity_name;
	return "Generated" + GetLocalName(entity);
}


std::string clent::GetLocalName(const EntityDescriptor& entity)
{
	// Generated types live in the package namespace so enclosing classes join the name
	const std::string& name = entity.qualified_name;
	std::string package_prefix = entity.package_name + "::";
	if (entity.package_name == "" || !startswith(name, package_prefix.c_str()))
		return StringReplace(name != "" ? name : entity.simple_name, "::", "_");
	return StringReplace(name.substr(package_prefix.size()), "::", "_");
}


std::vector<clent::GeneratedFile> clent::EmitGraph(const EntityGraph& graph, const ProcessingOptions& options)
{
	std::vector<GeneratedFile> files;
	std::map<std::string, std::vector<const EntityDescriptor*> > packages;

	std::vector<const EntityDescriptor*> entities = graph.GetEntities();
	for (size_t i = 0; i < entities.size(); i++)
	{
		const EntityDescriptor& entity = *entities[i];
		LOG(main, INFO, "Generating %s %s\n", GetEntityKindName(entity.kind), entity.qualified_name.c_str());

		if (HasImplementation(entity))
			files.push_back(GenerateImplementation(entity));
		files.push_back(GenerateMetaHeader(entity));
		files.push_back(GenerateMetaSource(graph, entity));

		if (entity.kind == KIND_ENTITY)
			packages[entity.package_name].push_back(&entity);
	}

	if (options.generate_model)
	{
		for (std::map<std::string, std::vector<const EntityDescriptor*> >::const_iterator i = packages.begin(); i != packages.end(); ++i)
			GenerateModels(i->first, i->second, files);
	}

	std::sort(files.begin(), files.end(), ComparePaths);
	return files;
}

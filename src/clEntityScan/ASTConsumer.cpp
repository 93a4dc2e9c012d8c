
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "ASTConsumer.h"
#include "ContainerSpecs.h"

#include <clEntityCore/AttributeParser.h>
#include <clEntityCore/Logging.h>

#include <clang/AST/ASTContext.h>
#include <clang/AST/Attr.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/DeclTemplate.h>
#include <clang/AST/QualTypeNames.h>
#include <clang/Basic/SourceManager.h>

#include <llvm/Support/raw_ostream.h>


namespace
{
	std::string GetQualifiedName(const clang::NamedDecl* decl, const clang::PrintingPolicy& policy)
	{
		std::string name;
		llvm::raw_string_ostream out(name);
		decl->printQualifiedName(out, policy);
		return out.str();
	}


	// Innermost enclosing namespace, skipping any enclosing classes
	std::string GetPackageName(const clang::CXXRecordDecl* record_decl, const clang::PrintingPolicy& policy)
	{
		const clang::DeclContext* context = record_decl->getDeclContext();
		while (context != 0 && !context->isFileContext())
			context = context->getParent();

		const clang::NamespaceDecl* ns_decl = context != 0 ? llvm::dyn_cast<clang::NamespaceDecl>(context) : 0;
		if (ns_decl == 0)
			return "";
		return GetQualifiedName(ns_decl, policy);
	}


	unsigned int GetAccessModifiers(clang::AccessSpecifier access)
	{
		switch (access)
		{
		case clang::AS_private: return clent::MOD_PRIVATE;
		case clang::AS_protected: return clent::MOD_PROTECTED;
		default: return 0;
		}
	}


	bool IsIgnoredNamespace(const clang::NamespaceDecl* ns_decl)
	{
		// Library namespaces are large and never contain entities
		llvm::StringRef name = ns_decl->getName();
		return name == "std" || name == "__gnu_cxx" || name == "clent_internal";
	}


	bool IsRecordableMethod(const clang::CXXMethodDecl* method_decl)
	{
		if (method_decl->isImplicit() || method_decl->isOverloadedOperator())
			return false;
		return !llvm::isa<clang::CXXConstructorDecl>(method_decl) &&
			!llvm::isa<clang::CXXDestructorDecl>(method_decl) &&
			!llvm::isa<clang::CXXConversionDecl>(method_decl);
	}


	unsigned int GetTypeFlags(const clang::CXXRecordDecl* record_decl, const clent::TypeDecl& type)
	{
		unsigned int flags = 0;
		if (record_decl->isAbstract())
			flags |= clent::TYPE_ABSTRACT;
		if (record_decl->hasAttr<clang::FinalAttr>())
			flags |= clent::TYPE_FINAL;

		// Interfaces have no state and only pure virtual methods
		int nb_fields = 0, nb_methods = 0, nb_pure = 0;
		for (size_t i = 0; i < type.members.size(); i++)
		{
			const clent::MemberDecl& member = type.members[i];
			if (member.kind == clent::MemberDecl::MEMBER_FIELD)
			{
				if ((member.modifiers & clent::MOD_STATIC) == 0)
					nb_fields++;
			}
			else
			{
				nb_methods++;
				if (member.modifiers & clent::MOD_PURE)
					nb_pure++;
			}
		}
		if (nb_fields == 0 && nb_methods > 0 && nb_pure == nb_methods)
			flags |= clent::TYPE_INTERFACE;

		return flags;
	}
}


ASTConsumer::ASTConsumer(clent::DeclDatabase& db, const ContainerSpecs& specs, const std::string& ast_log)
	: m_DB(db)
	, m_ContainerSpecs(specs)
	, m_ASTContext(0)
{
	LOG_TO_STDOUT(warnings, INFO);

	if (ast_log != "")
		LOG_TO_FILE(ast, ALL, ast_log.c_str());
}


ASTConsumer::~ASTConsumer()
{
}


void ASTConsumer::WalkTranslationUnit(clang::ASTContext* ast_context, clang::TranslationUnitDecl* tu_decl)
{
	m_ASTContext = ast_context;
	m_PrintingPolicy.reset(new clang::PrintingPolicy(m_ASTContext->getLangOpts()));
	m_PrintingPolicy->SuppressTagKeyword = true;
	m_PrintingPolicy->SuppressUnwrittenScope = false;

	LOG(ast, INFO, "Translation unit\n");
	LOG_PUSH_INDENT(ast);
	AddContainedDecls(tu_decl);
	LOG_POP_INDENT(ast);
}


void ASTConsumer::AddContainedDecls(clang::DeclContext* decl_context)
{
	for (clang::DeclContext::decl_iterator i = decl_context->decls_begin(); i != decl_context->decls_end(); ++i)
		AddDecl(*i);
}


void ASTConsumer::AddDecl(clang::Decl* decl)
{
	if (decl->isImplicit() || decl->isInvalidDecl())
		return;

	switch (decl->getKind())
	{
	case clang::Decl::Namespace:
	{
		clang::NamespaceDecl* ns_decl = llvm::cast<clang::NamespaceDecl>(decl);
		if (!IsIgnoredNamespace(ns_decl))
			AddContainedDecls(ns_decl);
		break;
	}

	// extern "C++" blocks
	case clang::Decl::LinkageSpec:
		AddContainedDecls(llvm::cast<clang::LinkageSpecDecl>(decl));
		break;

	case clang::Decl::CXXRecord:
		AddClassDecl(llvm::cast<clang::CXXRecordDecl>(decl), false);
		break;

	default:
		break;
	}
}


void ASTConsumer::AddClassDecl(clang::CXXRecordDecl* record_decl, bool force)
{
	// Bases are referenced through any declaration so look for the definition
	if (!record_decl->isThisDeclarationADefinition())
	{
		if (!force)
			return;
		record_decl = record_decl->getDefinition();
		if (record_decl == 0)
			return;
	}

	// Templates, their instances, unions and unnamed types can't be entities
	if (record_decl->getDescribedClassTemplate() != 0 || record_decl->isDependentContext() ||
		llvm::isa<clang::ClassTemplateSpecializationDecl>(record_decl) ||
		record_decl->isUnion() || record_decl->isLambda() || record_decl->getIdentifier() == 0)
		return;

	clent::AnnotationList annotations = GetAnnotations(record_decl);
	if (annotations.empty() && !force)
	{
		// Nested types can still be annotated
		for (clang::DeclContext::decl_iterator i = record_decl->decls_begin(); i != record_decl->decls_end(); ++i)
		{
			clang::CXXRecordDecl* nested_decl = llvm::dyn_cast<clang::CXXRecordDecl>(*i);
			if (nested_decl != 0 && !nested_decl->isImplicit())
				AddClassDecl(nested_decl, false);
		}
		return;
	}

	// Headers are seen by many translation units
	std::string name = GetQualifiedName(record_decl, *m_PrintingPolicy);
	if (m_DB.FindType(name) != 0)
		return;

	// Record bases first so that they precede the types deriving from them
	std::vector<std::string> bases;
	for (clang::CXXRecordDecl::base_class_iterator i = record_decl->bases_begin(); i != record_decl->bases_end(); ++i)
	{
		clang::QualType base_type = i->getType();
		clang::CXXRecordDecl* base_decl = base_type->getAsCXXRecordDecl();
		if (base_decl != 0 && !llvm::isa<clang::ClassTemplateSpecializationDecl>(base_decl))
		{
			bases.push_back(GetQualifiedName(base_decl, *m_PrintingPolicy));
			AddClassDecl(base_decl, true);
		}
		else
		{
			bases.push_back(GetTypeName(base_type));
		}
	}

	LOG(ast, INFO, "class %s", name.c_str());
	for (size_t i = 0; i < bases.size(); i++)
		LOG_APPEND(ast, INFO, i == 0 ? " : %s" : ", %s", bases[i].c_str());
	LOG_NEWLINE(ast);
	LOG_PUSH_INDENT(ast);

	clent::TypeDecl& type = m_DB.AddType(name);
	type.package = GetPackageName(record_decl, *m_PrintingPolicy);
	GetLocation(record_decl, type.filename, type.line);
	type.bases = bases;
	type.annotations = annotations;

	std::vector<clang::CXXRecordDecl*> nested_decls;
	for (clang::DeclContext::decl_iterator i = record_decl->decls_begin(); i != record_decl->decls_end(); ++i)
	{
		clang::Decl* decl = *i;
		if (decl->isImplicit())
			continue;

		switch (decl->getKind())
		{
		case clang::Decl::Field:
		{
			clang::FieldDecl* field_decl = llvm::cast<clang::FieldDecl>(decl);

			// Unnamed bitfields are padding
			if (field_decl->getIdentifier() != 0)
				AddFieldDecl(type, field_decl, field_decl->getType(), GetAccessModifiers(field_decl->getAccess()));
			break;
		}

		case clang::Decl::Var:
		{
			clang::VarDecl* var_decl = llvm::cast<clang::VarDecl>(decl);
			if (var_decl->isStaticDataMember())
				AddFieldDecl(type, var_decl, var_decl->getType(), GetAccessModifiers(var_decl->getAccess()) | clent::MOD_STATIC);
			break;
		}

		case clang::Decl::CXXMethod:
		{
			clang::CXXMethodDecl* method_decl = llvm::cast<clang::CXXMethodDecl>(decl);
			if (IsRecordableMethod(method_decl))
				AddMethodDecl(type, method_decl);
			break;
		}

		case clang::Decl::CXXRecord:
			nested_decls.push_back(llvm::cast<clang::CXXRecordDecl>(decl));
			break;

		default:
			break;
		}
	}

	type.flags = GetTypeFlags(record_decl, type);
	LOG_POP_INDENT(ast);

	// Map nodes are stable so the type reference survives nested additions
	for (size_t i = 0; i < nested_decls.size(); i++)
		AddClassDecl(nested_decls[i], false);
}


void ASTConsumer::AddFieldDecl(clent::TypeDecl& type, clang::NamedDecl* decl, clang::QualType qual_type, unsigned int modifiers)
{
	std::string name = decl->getNameAsString();

	clent::TypeRef type_ref = MakeTypeRef(qual_type);
	if (decl->isInvalidDecl())
		type_ref = clent::TypeRef::Unresolved(type_ref.name);

	clent::MemberDecl& member = m_DB.AddMember(type, name, clent::MemberDecl::MEMBER_FIELD, type_ref);
	member.modifiers = modifiers;
	member.annotations = GetAnnotations(decl);

	std::string filename;
	GetLocation(decl, filename, member.line);
	if (!type_ref.resolved)
		LOG(warnings, INFO, "%s(%d) : WARNING - Type of '%s' could not be resolved\n", filename.c_str(), member.line, name.c_str());

	LOG(ast, INFO, "Field: %s%s%s %s\n",
		type_ref.is_const ? "const " : "",
		type_ref.GetFullName().c_str(),
		type_ref.qualifier == clent::TypeRef::POINTER ? "*" : type_ref.qualifier == clent::TypeRef::REFERENCE ? "&" : "",
		name.c_str());
}


void ASTConsumer::AddMethodDecl(clent::TypeDecl& type, clang::CXXMethodDecl* method_decl)
{
	std::string name = method_decl->getNameAsString();

	clent::TypeRef type_ref = MakeTypeRef(method_decl->getReturnType());
	if (method_decl->isInvalidDecl())
		type_ref = clent::TypeRef::Unresolved(type_ref.name);

	clent::MemberDecl& member = m_DB.AddMember(type, name, clent::MemberDecl::MEMBER_METHOD, type_ref);
	member.nb_params = method_decl->getNumParams();
	member.modifiers = GetAccessModifiers(method_decl->getAccess());
	if (method_decl->isStatic())
		member.modifiers |= clent::MOD_STATIC;
	if (method_decl->isConst())
		member.modifiers |= clent::MOD_CONST;
	if (method_decl->isVirtual())
		member.modifiers |= clent::MOD_VIRTUAL;
	if (method_decl->isPure())
		member.modifiers |= clent::MOD_PURE;
	member.annotations = GetAnnotations(method_decl);

	std::string filename;
	GetLocation(method_decl, filename, member.line);

	LOG(ast, INFO, "Method: %s %s(%d)%s%s\n",
		type_ref.GetFullName().c_str(),
		name.c_str(),
		member.nb_params,
		(member.modifiers & clent::MOD_CONST) ? " const" : "",
		(member.modifiers & clent::MOD_PURE) ? " = 0" : "");
}


clent::TypeRef ASTConsumer::MakeTypeRef(clang::QualType qual_type)
{
	if (qual_type.isNull())
		return clent::TypeRef::Unresolved("");
	if (qual_type->isDependentType() || qual_type->containsErrors())
		return clent::TypeRef::Unresolved(qual_type.getAsString(*m_PrintingPolicy));

	// Only the outermost level of indirection is recorded
	clent::TypeRef ref;
	if (qual_type->isReferenceType())
	{
		ref.qualifier = clent::TypeRef::REFERENCE;
		qual_type = qual_type->getPointeeType();
	}
	else if (qual_type->isPointerType())
	{
		ref.qualifier = clent::TypeRef::POINTER;
		qual_type = qual_type->getPointeeType();
	}
	ref.is_const = qual_type.isConstQualified();
	qual_type = qual_type.getUnqualifiedType();

	// Look through typedefs for the template that implements a known container
	clang::CXXRecordDecl* record_decl = qual_type.getCanonicalType()->getAsCXXRecordDecl();
	clang::ClassTemplateSpecializationDecl* spec_decl = llvm::dyn_cast_or_null<clang::ClassTemplateSpecializationDecl>(record_decl);
	if (spec_decl != 0)
	{
		std::string template_name = GetQualifiedName(spec_decl->getSpecializedTemplate(), *m_PrintingPolicy);
		clent::TypeShape shape;
		if (m_ContainerSpecs.GetShape(template_name, shape))
		{
			ref.name = template_name;
			ref.shape = shape;

			// Prefer the arguments as written so that defaulted allocators don't show up
			const clang::TemplateSpecializationType* written = qual_type->getAs<clang::TemplateSpecializationType>();
			if (written != 0)
			{
				for (unsigned int i = 0; i < written->getNumArgs(); i++)
				{
					const clang::TemplateArgument& arg = written->getArg(i);
					if (arg.getKind() != clang::TemplateArgument::Type)
						break;
					ref.args.push_back(GetTypeName(arg.getAsType()));
				}
			}
			else
			{
				const clang::TemplateArgumentList& args = spec_decl->getTemplateArgs();
				for (unsigned int i = 0; i < args.size(); i++)
				{
					if (args[i].getKind() != clang::TemplateArgument::Type)
						break;
					ref.args.push_back(GetTypeName(args[i].getAsType()));
				}
			}

			return ref;
		}
	}

	// Anything else keeps its written name, so std::string stays std::string
	ref.name = GetTypeName(qual_type);
	return ref;
}


std::string ASTConsumer::GetTypeName(clang::QualType qual_type)
{
	return clang::TypeName::getFullyQualifiedName(qual_type, *m_ASTContext, *m_PrintingPolicy);
}


clent::AnnotationList ASTConsumer::GetAnnotations(clang::Decl* decl)
{
	clent::AnnotationList annotations;
	if (!decl->hasAttrs())
		return annotations;

	std::string filename;
	int line = 0;
	GetLocation(decl, filename, line);

	for (clang::specific_attr_iterator<clang::AnnotateAttr> i = decl->specific_attr_begin<clang::AnnotateAttr>();
		i != decl->specific_attr_end<clang::AnnotateAttr>(); ++i)
	{
		// Annotations from other tools are left alone
		clent::Dialect dialect;
		std::string text;
		if (!clent::SplitAnnotationText((*i)->getAnnotation().str(), dialect, text))
			continue;

		clent::AnnotationList parsed = clent::ParseAttributes(dialect, text.c_str(), filename.c_str(), line);
		annotations.insert(annotations.end(), parsed.begin(), parsed.end());
	}

	return annotations;
}


void ASTConsumer::GetLocation(clang::Decl* decl, std::string& filename, int& line)
{
	// Declarations written inside macros are reported where the macro is used
	clang::SourceManager& srcmgr = m_ASTContext->getSourceManager();
	clang::SourceLocation location = srcmgr.getExpansionLoc(decl->getLocation());
	clang::PresumedLoc presumed_loc = srcmgr.getPresumedLoc(location);
	if (presumed_loc.isInvalid())
	{
		filename = "";
		line = 0;
		return;
	}

	filename = presumed_loc.getFilename();
	line = presumed_loc.getLine();
}

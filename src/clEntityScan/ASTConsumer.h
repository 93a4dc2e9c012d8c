
//
// ===============================================================================
// clEntity, ASTConsumer.h - Traversal of the clang AST for C++, returning an
// offline declaration database.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#pragma once


#include <clEntityCore/DeclDatabase.h>

#include <memory>


class ContainerSpecs;

namespace clang
{
	class ASTContext;
	class CXXMethodDecl;
	class CXXRecordDecl;
	class Decl;
	class DeclContext;
	class NamedDecl;
	class TranslationUnitDecl;
	class QualType;
	struct PrintingPolicy;
}


//
// Records every class definition carrying clEntity annotations, along with the classes they
// derive from, so that inheritance can be walked without the AST.
//
class ASTConsumer
{
public:
	ASTConsumer(clent::DeclDatabase& db, const ContainerSpecs& specs, const std::string& ast_log);
	~ASTConsumer();

	void WalkTranslationUnit(clang::ASTContext* ast_context, clang::TranslationUnitDecl* tu_decl);

private:
	void AddContainedDecls(clang::DeclContext* decl_context);
	void AddDecl(clang::Decl* decl);
	void AddClassDecl(clang::CXXRecordDecl* record_decl, bool force);
	void AddFieldDecl(clent::TypeDecl& type, clang::NamedDecl* decl, clang::QualType qual_type, unsigned int modifiers);
	void AddMethodDecl(clent::TypeDecl& type, clang::CXXMethodDecl* method_decl);

	clent::TypeRef MakeTypeRef(clang::QualType qual_type);
	std::string GetTypeName(clang::QualType qual_type);

	clent::AnnotationList GetAnnotations(clang::Decl* decl);
	void GetLocation(clang::Decl* decl, std::string& filename, int& line);

	clent::DeclDatabase& m_DB;
	const ContainerSpecs& m_ContainerSpecs;

	clang::ASTContext* m_ASTContext;
	std::unique_ptr<clang::PrintingPolicy> m_PrintingPolicy;
};
